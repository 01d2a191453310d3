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

#ifndef _BANDCLASS_IO_ASSIGNMENT_WRITER_HPP_
#define _BANDCLASS_IO_ASSIGNMENT_WRITER_HPP_

#include "bandclass/data/Assignment.hpp"
#include "bandclass/io/Message.hpp"
#include "bandclass/misc/Exceptions.hpp"
#include "bandclass/misc/fmt.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <fstream>
#include <ostream>

#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_ZLIB
#include <boost/iostreams/filter/gzip.hpp>
#endif
#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_BZIP2
#include <boost/iostreams/filter/bzip2.hpp>
#endif


namespace bandclass
{
/// Writer for the long-form assignment and the section summary tables
struct AssignmentWriter
{
   static void
   writeAssignment( const String& filename, const LongAssignment& rows )
   {
      std::ofstream file( filename, std::ofstream::out | std::ofstream::binary );
      if( !file )
         throw InvalidInput( fmt::format( "could not open {} for writing", filename ) );
      boost::iostreams::filtering_ostream out;
      push_compressor( filename, out );
      out.push( file );
      printAssignment( out, rows );
   }

   static void
   writeSections( const String& filename, const SectionSummary& summary )
   {
      std::ofstream file( filename, std::ofstream::out | std::ofstream::binary );
      if( !file )
         throw InvalidInput( fmt::format( "could not open {} for writing", filename ) );
      boost::iostreams::filtering_ostream out;
      push_compressor( filename, out );
      out.push( file );
      printSections( out, summary );
   }

   /// file name suffix of a compression supported by this build, throws InvalidInput otherwise
   static String
   getCompressionSuffix( const String& compression )
   {
      if( compression.empty() )
         return "";
#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_ZLIB
      if( compression == "gz" )
         return ".gz";
#endif
#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_BZIP2
      if( compression == "bz2" )
         return ".bz2";
#endif
      throw InvalidInput( fmt::format( "output compression '{}' is not available", compression ) );
   }

   static void
   printAssignment( std::ostream& out, const LongAssignment& rows )
   {
      fmt::print( out, "student,instrument,assignment,preference\n" );
      for( const AssignmentRow& row : rows )
         fmt::print( out, "{},{},{},{}\n", row.student, row.instrument, row.assignment ? 1 : 0, row.preference );
   }

   static void
   printSections( std::ostream& out, const SectionSummary& summary )
   {
      fmt::print( out, "instrument,target,actual,difference,label\n" );
      for( const SectionRow& row : summary )
         fmt::print( out, "{},{},{},{},{}\n", row.instrument, row.target, row.actual, row.difference, row.label );
   }

   /// assigned rows and sections as aligned tables on the log
   static void
   log( const Message& msg, const LongAssignment& rows, const SectionSummary& summary )
   {
      msg.info( "\n{:<24} {:<20} {:>10}\n", "student", "instrument", "preference" );
      for( const AssignmentRow& row : rows )
         if( row.assignment )
            msg.info( "{:<24} {:<20} {:>10}\n", row.student, row.instrument, row.preference );

      msg.info( "\n{:<20} {:>6} {:>6} {:>10} {:>8}\n", "instrument", "target", "actual", "difference", "label" );
      for( const SectionRow& row : summary )
         msg.info( "{:<20} {:>6} {:>6} {:>10} {:>8}\n", row.instrument, row.target, row.actual, row.difference,
                   row.label );
   }

 private:
   static void
   push_compressor( const String& filename, boost::iostreams::filtering_ostream& out )
   {
#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_ZLIB
      if( boost::algorithm::ends_with( filename, ".gz" ) )
         out.push( boost::iostreams::gzip_compressor() );
#endif
#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_BZIP2
      if( boost::algorithm::ends_with( filename, ".bz2" ) )
         out.push( boost::iostreams::bzip2_compressor() );
#endif
   }
};

} // namespace bandclass

#endif
