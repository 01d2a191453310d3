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

#ifndef __BANDCLASS_MODEL_RESULTSHAPER_HPP__
#define __BANDCLASS_MODEL_RESULTSHAPER_HPP__

#include "bandclass/data/Assignment.hpp"
#include "bandclass/data/BandData.hpp"
#include "bandclass/misc/Exceptions.hpp"
#include "bandclass/misc/Hash.hpp"
#include "bandclass/misc/fmt.hpp"
#include <cstdlib>
#include <utility>


namespace bandclass
{
   class ResultShaper
   {
   public:

      /**
       * one row per (student, instrument) cell carrying the 1-based preference rank of assigned cells
       * @param wide solved assignment
       * @param preferences the preferences the assignment was computed from
       * @return rows in student major order
       */
      static LongAssignment
      toLongForm(const WideAssignment& wide, const StudentPreferences& preferences)
      {
         LongAssignment rows;
         rows.reserve(wide.getNStudents() * wide.getNInstruments());

         for( int s = 0; s < wide.getNStudents(); ++s )
         {
            const String& student = wide.getStudents()[s];
            int index = preferences.find(student);
            if( index < 0 )
               throw InternalConsistency(fmt::format("student '{}' has no preferences", student));

            int nassigned = 0;
            for( int i = 0; i < wide.getNInstruments(); ++i )
            {
               const String& instrument = wide.getInstruments()[i];
               AssignmentRow row { student, instrument, wide.isAssigned(s, i), 0 };
               if( row.assignment )
               {
                  int rank = preferences.getRank(index, instrument);
                  if( rank < 0 )
                     throw InternalConsistency(fmt::format("student '{}' is assigned '{}' which is not in the list",
                                                           student, instrument));
                  row.preference = rank + 1;
                  ++nassigned;
               }
               rows.push_back(std::move(row));
            }

            if( nassigned != 1 )
               throw InternalConsistency(fmt::format("student '{}' is assigned {} instruments", student, nassigned));
         }

         return rows;
      }

      /**
       * assigned headcount per instrument compared with its target, in the order of the targets
       */
      static SectionSummary
      summarizeSections(const LongAssignment& rows, const InstrumentTargets& targets)
      {
         HashMap<String, int> actual;
         for( const AssignmentRow& row : rows )
            if( row.assignment )
               ++actual[row.instrument];

         SectionSummary summary;
         summary.reserve(targets.size());
         for( int i = 0; i < targets.size(); ++i )
         {
            const String& instrument = targets.getName(i);
            auto it = actual.find(instrument);
            int count = it == actual.end() ? 0 : it->second;
            summary.push_back({ instrument, targets.getCount(i), count, std::abs(count - targets.getCount(i)),
                                fmt::format("{}/{}", count, targets.getCount(i)) });
         }

         return summary;
      }

      /// sum of the 0-based ranks of all assigned instruments
      static int
      getPreferenceCost(const LongAssignment& rows)
      {
         int cost = 0;
         for( const AssignmentRow& row : rows )
            if( row.assignment )
               cost += row.preference - 1;
         return cost;
      }

      static int
      getSectionDeviation(const SectionSummary& summary)
      {
         int deviation = 0;
         for( const SectionRow& row : summary )
            deviation += row.difference;
         return deviation;
      }
   };

} // namespace bandclass

#endif
