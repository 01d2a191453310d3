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
#include "bandclass/data/BandRun.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include <fstream>
#include <sstream>

namespace bandclass
{
namespace
{

using ::testing::AllOf;
using ::testing::HasSubstr;

void
appendOutput( VerbosityLevel, const char* data, std::size_t size, void* usrptr )
{
   static_cast<String*>( usrptr )->append( data, size );
}

String
writeFile( const String& name, const String& content )
{
   String filename = ::testing::TempDir() + name;
   std::ofstream file( filename );
   file << content;
   return filename;
}

String
readFile( const String& filename )
{
   std::ifstream file( filename );
   std::ostringstream content;
   content << file.rdbuf();
   return content.str();
}

class BandRunTest : public ::testing::Test
{
 protected:
   void
   SetUp() override
   {
      msg.setOutputCallback( appendOutput, &log );
      options.instruments_file = writeFile( "band_instruments.csv", "instrument,count\n"
                                                                    "trumpet,1\n"
                                                                    "drums,1\n" );
      options.students_file = writeFile( "band_students.csv", "student,choice1,choice2\n"
                                                              "Alice,trumpet,drums\n"
                                                              "Bob,drums,trumpet\n" );
   }

   int
   run( SolverFactory<double>* solver_factory )
   {
      std::shared_ptr<SolverFactory<double>> factory{ solver_factory };
      return BandRun<double>( msg, parameters, factory ).apply( options );
   }

   Message msg;
   BandParameters parameters;
   OptionsInfo options;
   String log;
};

TEST_F( BandRunTest, LogsAssignment )
{
   EXPECT_EQ( run( new EnumerationFactory() ), kSuccess );
   EXPECT_THAT( log, AllOf( HasSubstr( "preference cost 0 section deviation 0" ), HasSubstr( "Alice" ) ) );
}

TEST_F( BandRunTest, WritesOutputFiles )
{
   options.output_prefix = ::testing::TempDir() + "band_run";

   ASSERT_EQ( run( new EnumerationFactory() ), kSuccess );

   EXPECT_EQ( readFile( options.output_prefix + "_assignment.csv" ),
              "student,instrument,assignment,preference\n"
              "Alice,trumpet,1,1\n"
              "Alice,drums,0,0\n"
              "Bob,trumpet,0,0\n"
              "Bob,drums,1,1\n" );
   EXPECT_EQ( readFile( options.output_prefix + "_sections.csv" ),
              "instrument,target,actual,difference,label\n"
              "trumpet,1,1,0,1/1\n"
              "drums,1,1,0,1/1\n" );
}

TEST_F( BandRunTest, RejectsUnavailableCompression )
{
   options.output_prefix = ::testing::TempDir() + "band_zip";
   parameters.output_compression = "zip";

   EXPECT_EQ( run( new EnumerationFactory() ), kInvalidInput );
}

TEST_F( BandRunTest, ReportsInfeasibility )
{
   options.instruments_file = writeFile( "band_tuba.csv", "trumpet,10\n" );
   options.students_file = writeFile( "band_trio.csv", "Alice,trumpet\nBob,trumpet\nCarla,trumpet\n" );

   EXPECT_EQ( run( new EnumerationFactory() ), kInfeasible );
}

TEST_F( BandRunTest, ComparesAllModes )
{
   options.compare = true;

   EXPECT_EQ( run( new EnumerationFactory() ), kSuccess );
   EXPECT_THAT( log, AllOf( HasSubstr( "section deviation" ), HasSubstr( "students" ), HasSubstr( "balanced" ),
                            HasSubstr( "instrumentation" ) ) );
}

TEST_F( BandRunTest, ComparisonSucceedsWithOneFeasibleMode )
{
   // only the students mode has no section bounds
   options.instruments_file = writeFile( "band_tuba.csv", "trumpet,10\n" );
   options.students_file = writeFile( "band_trio.csv", "Alice,trumpet\nBob,trumpet\nCarla,trumpet\n" );
   options.compare = true;

   EXPECT_EQ( run( new EnumerationFactory() ), kSuccess );
}

TEST_F( BandRunTest, ComparisonFailsWithoutFeasibleMode )
{
   options.compare = true;

   EXPECT_EQ( run( new FixedFactory( {} ) ), kInfeasible );
}

TEST_F( BandRunTest, MapsInvalidInput )
{
   options.students_file = writeFile( "band_flute.csv", "Alice,flute\n" );

   EXPECT_EQ( run( new EnumerationFactory() ), kInvalidInput );
   EXPECT_THAT( log, AllOf( HasSubstr( "invalid input" ), HasSubstr( "flute" ) ) );
}

TEST_F( BandRunTest, MapsMissingFile )
{
   options.instruments_file = ::testing::TempDir() + "does_not_exist.csv";

   EXPECT_EQ( run( new EnumerationFactory() ), kInvalidInput );
}

TEST_F( BandRunTest, MapsSolverError )
{
   EXPECT_EQ( run( new FixedFactory( {}, -3 ) ), kSolverFailure );
   EXPECT_THAT( log, HasSubstr( "solver error" ) );
}

TEST_F( BandRunTest, MapsInternalConsistency )
{
   EXPECT_EQ( run( new FixedFactory( { 1.0, 1.0, 0.0, 1.0 } ) ), kSolverFailure );
   EXPECT_THAT( log, HasSubstr( "internal error" ) );
}

} // namespace
} // namespace bandclass
