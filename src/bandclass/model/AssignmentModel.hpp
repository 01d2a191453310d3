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

#ifndef __BANDCLASS_MODEL_ASSIGNMENTMODEL_HPP__
#define __BANDCLASS_MODEL_ASSIGNMENTMODEL_HPP__

#include "bandclass/data/BandData.hpp"
#include "bandclass/data/BandParameters.hpp"
#include "bandclass/data/PreferenceMode.hpp"
#include "bandclass/data/Problem.hpp"
#include "bandclass/data/ProblemBuilder.hpp"
#include "bandclass/misc/fmt.hpp"
#include <cassert>


namespace bandclass
{

   /**
    * translates a band instance into a binary program with one column per (student, instrument) cell
    * @tparam REAL arithmetic type of the problem
    */
   template <typename REAL>
   class AssignmentModel
   {
   public:

      static int
      getCol(int student, int instrument, int ninstruments)
      {
         return student * ninstruments + instrument;
      }

      /**
       * builds the problem, the inputs have to be validated before
       * @param targets instruments with their ideal headcounts
       * @param preferences ranked choices per student
       * @param weights objective weights of the preference mode
       * @param parameters section bound factors
       * @return minimization problem over the assignment cells
       */
      static Problem<REAL>
      build(const InstrumentTargets& targets, const StudentPreferences& preferences, const WeightConfig& weights,
            const BandParameters& parameters)
      {
         int ninstruments = targets.size( );
         int nstudents = preferences.size( );
         int ncols = nstudents * ninstruments;
         int nrows = countRows(targets, preferences, weights);

         ProblemBuilder<REAL> builder;
         builder.reserve(2 * ncols + (weights.apply_section_bounds ? 2 * ncols : 0), nrows, ncols);
         builder.setNumCols(ncols);
         builder.setNumRows(nrows);
         builder.setProblemName("band_class_assignment");
         builder.setObjSense(true);

         REAL offset { 0 };
         for( int i = 0; i < ninstruments; ++i )
            offset += REAL(weights.composition_weight) * REAL(targets.getCount(i));
         builder.setObjOffset(offset);

         for( int s = 0; s < nstudents; ++s )
         {
            for( int i = 0; i < ninstruments; ++i )
            {
               int col = getCol(s, i, ninstruments);
               int rank = preferences.getRank(s, targets.getName(i));
               REAL coefficient = -REAL(weights.composition_weight);
               if( rank > 0 )
                  coefficient += REAL(rank) * REAL(weights.preference_weight);
               builder.setColBinary(col);
               builder.setObj(col, coefficient);
               builder.setColName(col, fmt::format("Assignment_{}_{}", preferences.getName(s), targets.getName(i)));
            }
         }

         int row = 0;
         for( int s = 0; s < nstudents; ++s )
         {
            const String& student = preferences.getName(s);

            for( int i = 0; i < ninstruments; ++i )
               builder.addEntry(row, getCol(s, i, ninstruments), REAL{ 1 });
            setRowSides(builder, row, REAL{ 1 }, REAL{ 1 });
            builder.setRowName(row, fmt::format("{}_will_play_1_instrument", student));
            ++row;

            if( static_cast<int>(preferences.getChoices(s).size( )) < ninstruments )
            {
               for( int i = 0; i < ninstruments; ++i )
                  if( preferences.getRank(s, targets.getName(i)) < 0 )
                     builder.addEntry(row, getCol(s, i, ninstruments), REAL{ 1 });
               setRowSides(builder, row, REAL{ 0 }, REAL{ 0 });
               builder.setRowName(row, fmt::format("{}_instrument_selection", student));
               ++row;
            }
         }

         if( weights.apply_section_bounds )
         {
            for( int i = 0; i < ninstruments; ++i )
            {
               int floor = parameters.getSectionFloor(targets.getCount(i));
               for( int s = 0; s < nstudents; ++s )
                  builder.addEntry(row, getCol(s, i, ninstruments), REAL{ 1 });
               builder.setRowLhsInf(row, false);
               builder.setRowRhsInf(row, true);
               builder.setRowLhs(row, REAL(floor));
               builder.setRowName(row, fmt::format("more_than_{}_{}", floor, targets.getName(i)));
               ++row;
            }

            for( int i = 0; i < ninstruments; ++i )
            {
               int ceil = parameters.getSectionCeil(targets.getCount(i));
               for( int s = 0; s < nstudents; ++s )
                  builder.addEntry(row, getCol(s, i, ninstruments), REAL{ 1 });
               builder.setRowLhsInf(row, true);
               builder.setRowRhsInf(row, false);
               builder.setRowRhs(row, REAL(ceil));
               builder.setRowName(row, fmt::format("less_than_{}_{}", ceil, targets.getName(i)));
               ++row;
            }
         }
         assert(row == nrows);

         return builder.build( );
      }

   private:

      static int
      countRows(const InstrumentTargets& targets, const StudentPreferences& preferences, const WeightConfig& weights)
      {
         int nrows = weights.apply_section_bounds ? 2 * targets.size( ) : 0;
         for( int s = 0; s < preferences.size( ); ++s )
            nrows += static_cast<int>(preferences.getChoices(s).size( )) < targets.size( ) ? 2 : 1;
         return nrows;
      }

      static void
      setRowSides(ProblemBuilder<REAL>& builder, int row, const REAL& lhs, const REAL& rhs)
      {
         builder.setRowLhsInf(row, false);
         builder.setRowRhsInf(row, false);
         builder.setRowLhs(row, lhs);
         builder.setRowRhs(row, rhs);
      }
   };

} // namespace bandclass

#endif
