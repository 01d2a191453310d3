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

#include "bandclass/io/AssignmentWriter.hpp"
#include "bandclass/io/BandReader.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include <fstream>
#include <sstream>

#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_ZLIB
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#endif

namespace bandclass
{
namespace
{

using ::testing::AllOf;
using ::testing::HasSubstr;

TEST( BandReaderTest, ParsesTargets )
{
   std::istringstream in( "Instrument,Count\n"
                          "trumpet, 2\n"
                          "\n"
                          "# percussion\n"
                          "drums,1,\n" );

   InstrumentTargets targets = BandReader::parseTargets( in, "targets.csv" );

   ASSERT_EQ( targets.size(), 2 );
   EXPECT_EQ( targets.getName( 0 ), "trumpet" );
   EXPECT_EQ( targets.getCount( 0 ), 2 );
   EXPECT_EQ( targets.getName( 1 ), "drums" );
   EXPECT_EQ( targets.getCount( 1 ), 1 );
}

TEST( BandReaderTest, FindsHeaderAfterComments )
{
   std::istringstream in( "# band 2026\n"
                          "\n"
                          "instrument,count\n"
                          "trumpet,2\n" );

   InstrumentTargets targets = BandReader::parseTargets( in, "instruments.csv" );

   ASSERT_EQ( targets.size(), 1 );
   EXPECT_EQ( targets.getName( 0 ), "trumpet" );
}

TEST( BandReaderTest, SkipsByteOrderMark )
{
   std::istringstream targets_in( "\xEF\xBB\xBF" "instrument,count\n"
                                  "trumpet,2\n" );
   std::istringstream students_in( "\xEF\xBB\xBF" "Alice,trumpet\n" );

   InstrumentTargets targets = BandReader::parseTargets( targets_in, "instruments.csv" );
   StudentPreferences preferences = BandReader::parsePreferences( students_in, "students.csv" );

   ASSERT_EQ( targets.size(), 1 );
   EXPECT_EQ( targets.getName( 0 ), "trumpet" );
   ASSERT_EQ( preferences.size(), 1 );
   EXPECT_EQ( preferences.getName( 0 ), "Alice" );
}

TEST( BandReaderTest, TreatsHeaderWordAfterDataAsData )
{
   std::istringstream in( "trumpet,2\n"
                          "instrument,count\n" );

   EXPECT_THROW( BandReader::parseTargets( in, "instruments.csv" ), InvalidInput );
}

TEST( BandReaderTest, ReportsLineOfMalformedTarget )
{
   std::istringstream in( "trumpet,2\n"
                          "drums,many\n" );

   try
   {
      BandReader::parseTargets( in, "targets.csv" );
      FAIL() << "malformed count accepted";
   }
   catch( const InvalidInput& e )
   {
      EXPECT_THAT( e.what(), HasSubstr( "targets.csv:2" ) );
   }
}

TEST( BandReaderTest, ParsesPreferences )
{
   std::istringstream in( "student,choice1,choice2\n"
                          "Alice,trumpet,drums\n"
                          "Bob , drums ,,\n" );

   StudentPreferences preferences = BandReader::parsePreferences( in, "students.csv" );

   ASSERT_EQ( preferences.size(), 2 );
   EXPECT_EQ( preferences.getName( 1 ), "Bob" );
   EXPECT_EQ( preferences.getChoices( 0 ).size(), 2 );
   ASSERT_EQ( preferences.getChoices( 1 ).size(), 1 );
   EXPECT_EQ( preferences.getChoices( 1 )[0], "drums" );
}

TEST( BandReaderTest, RejectsDuplicateStudent )
{
   std::istringstream in( "Alice,trumpet\n"
                          "Alice,drums\n" );

   try
   {
      BandReader::parsePreferences( in, "students.csv" );
      FAIL() << "duplicate student accepted";
   }
   catch( const InvalidInput& e )
   {
      EXPECT_THAT( e.what(), AllOf( HasSubstr( "students.csv:2" ), HasSubstr( "Alice" ) ) );
   }
}

TEST( BandReaderTest, RejectsMissingFile )
{
   EXPECT_THROW( BandReader::readTargets( "does/not/exist.csv" ), InvalidInput );
   EXPECT_THROW( BandReader::readPreferences( "does/not/exist.csv" ), InvalidInput );
}

TEST( AssignmentWriterTest, PrintsTables )
{
   LongAssignment rows{ { "Alice", "trumpet", true, 1 }, { "Alice", "drums", false, 0 } };
   SectionSummary summary{ { "trumpet", 1, 1, 0, "1/1" }, { "drums", 1, 0, 1, "0/1" } };

   std::ostringstream assignment;
   AssignmentWriter::printAssignment( assignment, rows );
   EXPECT_EQ( assignment.str(), "student,instrument,assignment,preference\n"
                                "Alice,trumpet,1,1\n"
                                "Alice,drums,0,0\n" );

   std::ostringstream sections;
   AssignmentWriter::printSections( sections, summary );
   EXPECT_EQ( sections.str(), "instrument,target,actual,difference,label\n"
                              "trumpet,1,1,0,1/1\n"
                              "drums,1,0,1,0/1\n" );
}

TEST( AssignmentWriterTest, RejectsUnknownCompression )
{
   EXPECT_EQ( AssignmentWriter::getCompressionSuffix( "" ), "" );
   EXPECT_THROW( AssignmentWriter::getCompressionSuffix( "zip" ), InvalidInput );
}

#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_ZLIB
TEST( AssignmentWriterTest, CompressesGzipFiles )
{
   String filename = ::testing::TempDir() + "writer_sections.csv" + AssignmentWriter::getCompressionSuffix( "gz" );
   SectionSummary summary{ { "trumpet", 1, 1, 0, "1/1" } };

   AssignmentWriter::writeSections( filename, summary );

   std::ifstream file( filename, std::ifstream::in | std::ifstream::binary );
   ASSERT_TRUE( file );
   boost::iostreams::filtering_istream in;
   in.push( boost::iostreams::gzip_decompressor() );
   in.push( file );
   std::ostringstream content;
   content << in.rdbuf();
   EXPECT_EQ( content.str(), "instrument,target,actual,difference,label\n"
                             "trumpet,1,1,0,1/1\n" );
}
#endif

} // namespace
} // namespace bandclass
