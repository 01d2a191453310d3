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

#ifndef _BANDCLASS_DATA_PREFERENCE_MODE_HPP_
#define _BANDCLASS_DATA_PREFERENCE_MODE_HPP_

#include "bandclass/misc/String.hpp"
#include "bandclass/misc/Vec.hpp"
#include "bandclass/misc/fmt.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/optional.hpp>
#include <ostream>

namespace bandclass
{

/// trade-off between the choices of the students and the target instrumentation
enum class PreferenceMode : int
{
   kStudents = 0,

   kBalanced = 1,

   kInstrumentation = 2,
};

/// objective weights and whether section sizes are bounded
struct WeightConfig
{
   int composition_weight;
   int preference_weight;
   bool apply_section_bounds;
};

inline const Vec<PreferenceMode>&
allPreferenceModes()
{
   static const Vec<PreferenceMode> modes{ PreferenceMode::kStudents,
                                           PreferenceMode::kBalanced,
                                           PreferenceMode::kInstrumentation };
   return modes;
}

inline String
toString( PreferenceMode mode )
{
   switch( mode )
   {
   case PreferenceMode::kStudents:
      return "students";
   case PreferenceMode::kBalanced:
      return "balanced";
   case PreferenceMode::kInstrumentation:
      return "instrumentation";
   }
   return "unknown";
}

/// case insensitive lookup of a mode by its name
inline boost::optional<PreferenceMode>
parsePreferenceMode( const String& name )
{
   for( PreferenceMode mode : allPreferenceModes() )
      if( boost::iequals( name, toString( mode ) ) )
         return mode;
   return boost::none;
}

inline std::ostream&
operator<<( std::ostream& out, const PreferenceMode mode )
{
   return out << toString( mode );
}

} // namespace bandclass

BANDCLASS_OSTREAM_FORMATTER( bandclass::PreferenceMode )

#endif
