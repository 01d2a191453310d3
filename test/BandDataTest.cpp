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

#include "bandclass/data/BandData.hpp"
#include "bandclass/data/BandParameters.hpp"
#include "bandclass/data/PreferenceMode.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace bandclass
{
namespace
{

using ::testing::AllOf;
using ::testing::HasSubstr;

InstrumentTargets
smallTargets()
{
   return InstrumentTargets{ { "trumpet", 2 }, { "drums", 1 } };
}

TEST( BandDataTest, AcceptsConsistentInstance )
{
   InstrumentTargets targets{ { "trumpet", 1 }, { "drums", 1 } };
   StudentPreferences preferences{ { "Alice", { "trumpet", "drums" } },
                                   { "Bob", { "drums" } } };

   EXPECT_NO_THROW( validate( targets, preferences ) );
   EXPECT_EQ( targets.find( "drums" ), 1 );
   EXPECT_EQ( targets.find( "tuba" ), -1 );
   EXPECT_EQ( preferences.getRank( 0, "drums" ), 1 );
   EXPECT_EQ( preferences.getRank( 1, "trumpet" ), -1 );
}

TEST( BandDataTest, RejectsUnknownInstrument )
{
   InstrumentTargets targets{ { "tuba", 5 } };
   StudentPreferences preferences{ { "Carla", { "flute" } } };

   try
   {
      validate( targets, preferences );
      FAIL() << "unknown instrument accepted";
   }
   catch( const InvalidInput& e )
   {
      EXPECT_THAT( e.what(), AllOf( HasSubstr( "Carla" ), HasSubstr( "flute" ) ) );
   }
}

TEST( BandDataTest, RejectsEmptyTables )
{
   StudentPreferences preferences{ { "Alice", { "trumpet" } } };

   EXPECT_THROW( validate( InstrumentTargets{}, preferences ), InvalidInput );
   EXPECT_THROW( validate( smallTargets(), StudentPreferences{} ), InvalidInput );
}

TEST( BandDataTest, RejectsNegativeTarget )
{
   InstrumentTargets negative{ { "trumpet", -1 } };
   StudentPreferences preferences{ { "Alice", { "trumpet" } } };

   EXPECT_THROW( validate( negative, preferences ), InvalidInput );
}

TEST( BandDataTest, RejectsDuplicateNames )
{
   InstrumentTargets targets = smallTargets();
   StudentPreferences preferences{ { "Alice", { "trumpet" } } };

   EXPECT_THROW( targets.add( "drums", 3 ), InvalidInput );
   EXPECT_THROW( preferences.add( "Alice", { "drums" } ), InvalidInput );
   EXPECT_EQ( targets.size(), 2 );
   EXPECT_EQ( preferences.size(), 1 );
}

TEST( BandDataTest, RejectsMalformedLists )
{
   StudentPreferences empty{ { "Alice", {} } };
   EXPECT_THROW( validate( smallTargets(), empty ), InvalidInput );

   StudentPreferences twice{ { "Bob", { "drums", "trumpet", "drums" } } };
   try
   {
      validate( smallTargets(), twice );
      FAIL() << "duplicate choice accepted";
   }
   catch( const InvalidInput& e )
   {
      EXPECT_THAT( e.what(), HasSubstr( "twice" ) );
   }
}

TEST( PreferenceModeTest, MapsToWeights )
{
   BandParameters parameters;

   WeightConfig students = parameters.getWeightConfig( PreferenceMode::kStudents );
   EXPECT_EQ( students.composition_weight, 1 );
   EXPECT_EQ( students.preference_weight, 5 );
   EXPECT_FALSE( students.apply_section_bounds );

   WeightConfig balanced = parameters.getWeightConfig( PreferenceMode::kBalanced );
   EXPECT_EQ( balanced.composition_weight, 3 );
   EXPECT_EQ( balanced.preference_weight, 3 );
   EXPECT_TRUE( balanced.apply_section_bounds );

   parameters.instrumentation_weight = 5;
   WeightConfig instrumentation = parameters.getWeightConfig( PreferenceMode::kInstrumentation );
   EXPECT_EQ( instrumentation.composition_weight, 5 );
   EXPECT_EQ( instrumentation.preference_weight, 1 );
   EXPECT_TRUE( instrumentation.apply_section_bounds );
}

TEST( PreferenceModeTest, ParsesNames )
{
   ASSERT_TRUE( parsePreferenceMode( "Students" ) );
   EXPECT_EQ( parsePreferenceMode( "Students" ).get(), PreferenceMode::kStudents );
   EXPECT_EQ( parsePreferenceMode( "instrumentation" ).get(), PreferenceMode::kInstrumentation );
   EXPECT_FALSE( parsePreferenceMode( "orchestra" ) );
   EXPECT_EQ( fmt::format( "{}", PreferenceMode::kBalanced ), "balanced" );
}

TEST( BandParametersTest, SectionBoundsRoundOutwards )
{
   BandParameters parameters;

   EXPECT_EQ( parameters.getSectionFloor( 4 ), 3 );
   EXPECT_EQ( parameters.getSectionCeil( 4 ), 6 );
   EXPECT_EQ( parameters.getSectionFloor( 1 ), 0 );
   EXPECT_EQ( parameters.getSectionCeil( 1 ), 2 );
   EXPECT_EQ( parameters.getSectionFloor( 10 ), 7 );
   EXPECT_EQ( parameters.getSectionCeil( 3 ), 5 );
}

TEST( BandParametersTest, SectionBoundsIgnoreRepresentationError )
{
   BandParameters parameters;
   parameters.floorfactor = 0.29;
   parameters.ceilfactor = 1.1;

   // 0.29 * 100 and 1.1 * 10 are not exact in binary floating point
   EXPECT_EQ( parameters.getSectionFloor( 100 ), 29 );
   EXPECT_EQ( parameters.getSectionCeil( 10 ), 11 );
}

} // namespace
} // namespace bandclass
