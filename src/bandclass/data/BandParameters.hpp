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

#ifndef __BANDCLASS_DATA_BANDPARAMETERS_HPP__
#define __BANDCLASS_DATA_BANDPARAMETERS_HPP__

#include "bandclass/data/PreferenceMode.hpp"
#include "bandclass/misc/ParameterSet.hpp"
#include <cmath>


namespace bandclass {

   struct BandParameters
   {
      /// absorbs the representation error of factor * target before rounding
      static constexpr double kBoundEpsilon = 1e-9;

      double floorfactor = 0.75;
      double ceilfactor = 1.5;
      int instrumentation_weight = 3;
      double feastol = 1e-6;
      String debug_filename = "";
      String output_compression = "";

   public:

      void
      addParameters( ParameterSet& paramSet )
      {
         paramSet.addParameter( "model.floorfactor", "minimal section size relative to its target (rounded down)", floorfactor, 0.0, 1.0 );
         paramSet.addParameter( "model.ceilfactor", "maximal section size relative to its target (rounded up)", ceilfactor, 1.0 );
         paramSet.addParameter( "model.instrumentation_weight", "composition weight of preference mode instrumentation", instrumentation_weight, 0 );
         paramSet.addParameter( "numerics.feastol", "feasibility tolerance to consider constraints satisfied", feastol, 0.0, 1e-1 );
         paramSet.addParameter( "debug_filename", "if not empty, the model is written to this file before every solve", debug_filename );
         paramSet.addParameter( "output.compression", "compression of the written csv files, empty, gz or bz2", output_compression );
      }

      WeightConfig
      getWeightConfig( PreferenceMode mode ) const
      {
         switch( mode )
         {
         case PreferenceMode::kStudents:
            return { 1, 5, false };
         case PreferenceMode::kBalanced:
            return { 3, 3, true };
         case PreferenceMode::kInstrumentation:
            return { instrumentation_weight, 1, true };
         }
         throw std::invalid_argument( "unknown preference mode" );
      }

      int
      getSectionFloor( int target ) const
      {
         return static_cast<int>( std::floor( floorfactor * target + kBoundEpsilon ) );
      }

      int
      getSectionCeil( int target ) const
      {
         return static_cast<int>( std::ceil( ceilfactor * target - kBoundEpsilon ) );
      }
   };

} // namespace bandclass

#endif
