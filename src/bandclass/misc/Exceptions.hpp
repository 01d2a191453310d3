/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
/*                                                                           */
/*               This file is part of the program and library                */
/*                            BandClass                                      */
/*                                                                           */
/* Copyright (C) 2024             The BandClass Authors                      */
/*                                                                           */
/*  Licensed under the Apache License, Version 2.0 (the "License");          */
/*  you may not use this file except in compliance with the License.         */
/*  You may obtain a copy of the License at                                  */
/*                                                                           */
/*      http://www.apache.org/licenses/LICENSE-2.0                           */
/*                                                                           */
/*  Unless required by applicable law or agreed to in writing, software      */
/*  distributed under the License is distributed on an "AS IS" BASIS,        */
/*  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. */
/*  See the License for the specific language governing permissions and      */
/*  limitations under the License.                                           */
/*                                                                           */
/*  You should have received a copy of the Apache-2.0 license                */
/*  along with BandClass; see the file LICENSE. If not visit                 */
/*  https://www.apache.org/licenses/LICENSE-2.0.                             */
/*                                                                           */
/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

#ifndef _BANDCLASS_MISC_EXCEPTIONS_HPP_
#define _BANDCLASS_MISC_EXCEPTIONS_HPP_

#include "bandclass/misc/String.hpp"
#include <stdexcept>

namespace bandclass
{

/// malformed band data, raised before any problem is built
class InvalidInput : public std::invalid_argument
{
 public:
   explicit InvalidInput( const String& what ) : std::invalid_argument( what )
   {
   }
};

/// an assignment contradicting the model it was computed from
class InternalConsistency : public std::logic_error
{
 public:
   explicit InternalConsistency( const String& what ) : std::logic_error( what )
   {
   }
};

/// failure of the solver itself, not of the instance
class SolverError : public std::runtime_error
{
 public:
   explicit SolverError( const String& what ) : std::runtime_error( what ) {}
};

} // namespace bandclass

#endif
