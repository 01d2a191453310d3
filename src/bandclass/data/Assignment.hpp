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

#ifndef _BANDCLASS_DATA_ASSIGNMENT_HPP_
#define _BANDCLASS_DATA_ASSIGNMENT_HPP_

#include "bandclass/misc/String.hpp"
#include "bandclass/misc/Vec.hpp"
#include <cassert>
#include <cstdint>
#include <utility>

namespace bandclass
{

/// student x instrument grid of 0/1 values as returned by the solve
class WideAssignment
{
 public:
   WideAssignment( Vec<String> _students, Vec<String> _instruments,
                   Vec<uint8_t> _values )
       : students( std::move( _students ) ),
         instruments( std::move( _instruments ) ), values( std::move( _values ) )
   {
      assert( values.size() == students.size() * instruments.size() );
   }

   int
   getNStudents() const
   {
      return static_cast<int>( students.size() );
   }

   int
   getNInstruments() const
   {
      return static_cast<int>( instruments.size() );
   }

   const Vec<String>&
   getStudents() const
   {
      return students;
   }

   const Vec<String>&
   getInstruments() const
   {
      return instruments;
   }

   bool
   isAssigned( int student, int instrument ) const
   {
      return values[student * instruments.size() + instrument] != 0;
   }

   /// index of the first instrument assigned to the student or -1
   int
   getAssignedInstrument( int student ) const
   {
      for( int i = 0; i < getNInstruments(); ++i )
         if( isAssigned( student, i ) )
            return i;
      return -1;
   }

   int
   getNAssigned( int student ) const
   {
      int count = 0;
      for( int i = 0; i < getNInstruments(); ++i )
         if( isAssigned( student, i ) )
            ++count;
      return count;
   }

   int
   getSectionSize( int instrument ) const
   {
      int count = 0;
      for( int s = 0; s < getNStudents(); ++s )
         if( isAssigned( s, instrument ) )
            ++count;
      return count;
   }

 private:
   Vec<String> students;
   Vec<String> instruments;
   Vec<uint8_t> values;
};

/// one (student, instrument) cell of the assignment with its preference rank,
/// rank is 1-based for the assigned instrument and 0 everywhere else
struct AssignmentRow
{
   String student;
   String instrument;
   bool assignment;
   int preference;
};

using LongAssignment = Vec<AssignmentRow>;

/// assigned headcount of one instrument against its target
struct SectionRow
{
   String instrument;
   int target;
   int actual;
   int difference;
   String label;
};

using SectionSummary = Vec<SectionRow>;

} // namespace bandclass

#endif
