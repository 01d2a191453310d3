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

#include "TestSolvers.hpp"
#include "bandclass/model/AssignmentSolver.hpp"
#include "bandclass/model/ResultShaper.hpp"
#include "gtest/gtest.h"

namespace bandclass
{
namespace
{

Message
quietMessage()
{
   Message msg;
   msg.setVerbosityLevel( VerbosityLevel::kQuiet );
   return msg;
}

TEST( AssignmentSolverTest, GrantsFirstChoices )
{
   Message msg = quietMessage();
   BandParameters parameters;
   std::shared_ptr<SolverFactory<double>> factory{ new EnumerationFactory() };
   InstrumentTargets targets{ { "trumpet", 1 }, { "drums", 1 } };
   StudentPreferences preferences{ { "Alice", { "trumpet", "drums" } },
                                   { "Bob", { "drums", "trumpet" } } };

   AssignmentResult<double> result =
       AssignmentSolver<double>( msg, parameters, factory ).solve( targets, preferences, PreferenceMode::kBalanced );

   EXPECT_EQ( result.mode, PreferenceMode::kBalanced );
   EXPECT_EQ( result.status, SolverStatus::kOptimal );
   ASSERT_TRUE( result.isFeasible() );
   EXPECT_NEAR( result.objective, 0.0, 1e-9 );
   EXPECT_TRUE( result.assignment->isAssigned( 0, 0 ) );
   EXPECT_TRUE( result.assignment->isAssigned( 1, 1 ) );

   LongAssignment rows = ResultShaper::toLongForm( *result.assignment, preferences );
   for( const AssignmentRow& row : rows )
      if( row.assignment )
         EXPECT_EQ( row.preference, 1 ) << row.student;
}

TEST( AssignmentSolverTest, ReportsInfeasibility )
{
   Message msg = quietMessage();
   BandParameters parameters;
   std::shared_ptr<SolverFactory<double>> factory{ new EnumerationFactory() };
   InstrumentTargets targets{ { "trumpet", 10 } };
   StudentPreferences preferences{ { "Alice", { "trumpet" } },
                                   { "Bob", { "trumpet" } },
                                   { "Carla", { "trumpet" } } };

   AssignmentResult<double> result =
       AssignmentSolver<double>( msg, parameters, factory ).solve( targets, preferences, PreferenceMode::kBalanced );

   EXPECT_TRUE( result.isInfeasible() );
   EXPECT_FALSE( result.isFeasible() );

   // without section bounds every student simply plays trumpet
   AssignmentResult<double> relaxed =
       AssignmentSolver<double>( msg, parameters, factory ).solve( targets, preferences, PreferenceMode::kStudents );
   ASSERT_TRUE( relaxed.isFeasible() );
   EXPECT_EQ( relaxed.assignment->getSectionSize( 0 ), 3 );
}

TEST( AssignmentSolverTest, ValidatesBeforeSolving )
{
   Message msg = quietMessage();
   BandParameters parameters;
   auto enumeration = new EnumerationFactory();
   std::shared_ptr<SolverFactory<double>> factory{ enumeration };
   InstrumentTargets targets{ { "tuba", 5 } };
   StudentPreferences preferences{ { "Alice", { "flute" } } };

   EXPECT_THROW( AssignmentSolver<double>( msg, parameters, factory )
                     .solve( targets, preferences, PreferenceMode::kBalanced ),
                 InvalidInput );
   EXPECT_EQ( enumeration->created, 0 );
}

TEST( AssignmentSolverTest, TradesPreferencesAgainstSections )
{
   Message msg = quietMessage();
   BandParameters parameters;
   std::shared_ptr<SolverFactory<double>> factory{ new EnumerationFactory() };
   InstrumentTargets targets{ { "trumpet", 1 }, { "flute", 3 } };
   StudentPreferences preferences{ { "Alice", { "trumpet", "flute" } },
                                   { "Bob", { "trumpet", "flute" } },
                                   { "Carla", { "trumpet", "flute" } },
                                   { "Dan", { "trumpet", "flute" } } };
   AssignmentSolver<double> solver( msg, parameters, factory );

   AssignmentResult<double> students = solver.solve( targets, preferences, PreferenceMode::kStudents );
   AssignmentResult<double> instrumentation =
       solver.solve( targets, preferences, PreferenceMode::kInstrumentation );
   ASSERT_TRUE( students.isFeasible() );
   ASSERT_TRUE( instrumentation.isFeasible() );

   LongAssignment students_rows = ResultShaper::toLongForm( *students.assignment, preferences );
   LongAssignment instrumentation_rows = ResultShaper::toLongForm( *instrumentation.assignment, preferences );
   SectionSummary students_sections = ResultShaper::summarizeSections( students_rows, targets );
   SectionSummary instrumentation_sections = ResultShaper::summarizeSections( instrumentation_rows, targets );

   EXPECT_EQ( ResultShaper::getPreferenceCost( students_rows ), 0 );
   EXPECT_LE( ResultShaper::getPreferenceCost( students_rows ),
              ResultShaper::getPreferenceCost( instrumentation_rows ) );
   EXPECT_LE( ResultShaper::getSectionDeviation( instrumentation_sections ),
              ResultShaper::getSectionDeviation( students_sections ) );
   // the ceiling of the trumpet section is ceil(1.5 * 1)
   EXPECT_EQ( instrumentation.assignment->getSectionSize( 0 ), 2 );
   EXPECT_EQ( instrumentation.assignment->getSectionSize( 1 ), 2 );
}

class InvalidSolutionTest : public ::testing::Test
{
 protected:
   AssignmentResult<double>
   solveWith( FixedFactory* fixed )
   {
      std::shared_ptr<SolverFactory<double>> factory{ fixed };
      return AssignmentSolver<double>( msg, parameters, factory )
          .solve( targets, preferences, PreferenceMode::kStudents );
   }

   Message msg = quietMessage();
   BandParameters parameters;
   InstrumentTargets targets{ { "trumpet", 1 }, { "drums", 1 } };
   StudentPreferences preferences{ { "Alice", { "trumpet" } }, { "Bob", { "drums", "trumpet" } } };
};

TEST_F( InvalidSolutionTest, RejectsUnlistedInstrument )
{
   EXPECT_THROW( solveWith( new FixedFactory( { 0.0, 1.0, 0.0, 1.0 } ) ), InternalConsistency );
}

TEST_F( InvalidSolutionTest, RejectsTwoInstruments )
{
   EXPECT_THROW( solveWith( new FixedFactory( { 1.0, 0.0, 1.0, 1.0 } ) ), InternalConsistency );
}

TEST_F( InvalidSolutionTest, RejectsFractionalValue )
{
   EXPECT_THROW( solveWith( new FixedFactory( { 1.0, 0.0, 0.5, 0.5 } ) ), InternalConsistency );
}

TEST_F( InvalidSolutionTest, RejectsFailedSolverCheck )
{
   EXPECT_THROW( solveWith( new FixedFactory( { 1.0, 0.0, 0.0, 1.0 }, PRIMALFAIL ) ), InternalConsistency );
}

TEST_F( InvalidSolutionTest, PropagatesSolverError )
{
   EXPECT_THROW( solveWith( new FixedFactory( {}, -3 ) ), SolverError );
}

TEST_F( InvalidSolutionTest, AcceptsValidSolution )
{
   AssignmentResult<double> result = solveWith( new FixedFactory( { 1.0, 0.0, 0.0, 1.0 } ) );

   EXPECT_TRUE( result.isFeasible() );
   EXPECT_NEAR( result.objective, 0.0, 1e-9 );
}

} // namespace
} // namespace bandclass
