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

#ifndef _BANDCLASS_MISC_FLAGS_HPP_
#define _BANDCLASS_MISC_FLAGS_HPP_

#include <cstdint>
#include <type_traits>

namespace bandclass
{

/// bit set over the values of a flag enumeration whose values are powers of two
template <typename BaseType>
class Flags
{
 public:
   Flags() = default;

   template <typename... Args>
   Flags( BaseType flag, Args... flags ) : state( joinFlags( flag, flags... ) )
   {
   }

   template <typename... Args>
   void
   set( Args... flags )
   {
      state |= joinFlags( flags... );
   }

   void
   clear()
   {
      state = 0;
   }

   template <typename... Args>
   void
   unset( Args... flags )
   {
      state &= ~joinFlags( flags... );
   }

   /// true if any of the given flags is set
   template <typename... Args>
   bool
   test( Args... flags ) const
   {
      return state & joinFlags( flags... );
   }

   bool
   equal( Flags other ) const
   {
      return state == other.state;
   }

 private:
   using UnderlyingType = typename std::underlying_type<BaseType>::type;

   static UnderlyingType
   joinFlags( BaseType f )
   {
      return static_cast<UnderlyingType>( f );
   }

   template <typename... Args>
   static UnderlyingType
   joinFlags( BaseType f, Args... other )
   {
      return static_cast<UnderlyingType>( f ) | joinFlags( other... );
   }

   UnderlyingType state = 0;
};

} // namespace bandclass

#endif
