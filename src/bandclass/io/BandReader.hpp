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

#ifndef _BANDCLASS_IO_BAND_READER_HPP_
#define _BANDCLASS_IO_BAND_READER_HPP_

#include "bandclass/data/BandData.hpp"
#include "bandclass/misc/Exceptions.hpp"
#include "bandclass/misc/String.hpp"
#include "bandclass/misc/Vec.hpp"
#include "bandclass/misc/fmt.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <initializer_list>
#include <istream>
#include <utility>

#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_ZLIB
#include <boost/iostreams/filter/gzip.hpp>
#endif
#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_BZIP2
#include <boost/iostreams/filter/bzip2.hpp>
#endif


namespace bandclass
{
/// Reader for the comma separated instrument and student tables
struct BandReader
{
   /// reads lines of the form instrument,count
   static InstrumentTargets
   readTargets( const String& filename )
   {
      std::ifstream file( filename, std::ifstream::in | std::ifstream::binary );
      if( !file )
         throw InvalidInput( fmt::format( "could not open instrument file {}", filename ) );
      boost::iostreams::filtering_istream in;
      push_decompressor( filename, in );
      in.push( file );
      return parseTargets( in, filename );
   }

   /// reads lines of the form student,choice1,choice2,...
   static StudentPreferences
   readPreferences( const String& filename )
   {
      std::ifstream file( filename, std::ifstream::in | std::ifstream::binary );
      if( !file )
         throw InvalidInput( fmt::format( "could not open student file {}", filename ) );
      boost::iostreams::filtering_istream in;
      push_decompressor( filename, in );
      in.push( file );
      return parsePreferences( in, filename );
   }

   static InstrumentTargets
   parseTargets( std::istream& in, const String& source )
   {
      InstrumentTargets targets;
      String strline;
      int line = 0;
      bool seen_data = false;

      while( std::getline( in, strline ) )
      {
         ++line;
         if( line == 1 )
            strip_byte_order_mark( strline );
         Vec<String> tokens = split( strline );
         if( tokens.empty() )
            continue;

         bool header = !seen_data && line_is_header( tokens, { "instrument" } );
         seen_data = true;
         if( header )
            continue;

         if( tokens.size() != 2 )
            throw InvalidInput( fmt::format( "{}:{}: expected instrument,count but found {} fields",
                                             source, line, tokens.size() ) );

         int count;
         if( !boost::conversion::try_lexical_convert( tokens[1], count ) )
            throw InvalidInput( fmt::format( "{}:{}: count '{}' of instrument '{}' is not an integer",
                                             source, line, tokens[1], tokens[0] ) );

         try
         {
            targets.add( tokens[0], count );
         }
         catch( const InvalidInput& e )
         {
            throw InvalidInput( fmt::format( "{}:{}: {}", source, line, e.what() ) );
         }
      }

      return targets;
   }

   static StudentPreferences
   parsePreferences( std::istream& in, const String& source )
   {
      StudentPreferences preferences;
      String strline;
      int line = 0;
      bool seen_data = false;

      while( std::getline( in, strline ) )
      {
         ++line;
         if( line == 1 )
            strip_byte_order_mark( strline );
         Vec<String> tokens = split( strline );
         if( tokens.empty() )
            continue;

         bool header = !seen_data && line_is_header( tokens, { "student", "name" } );
         seen_data = true;
         if( header )
            continue;

         Vec<String> choices( tokens.begin() + 1, tokens.end() );
         try
         {
            preferences.add( tokens[0], std::move( choices ) );
         }
         catch( const InvalidInput& e )
         {
            throw InvalidInput( fmt::format( "{}:{}: {}", source, line, e.what() ) );
         }
      }

      return preferences;
   }

 private:
   static void
   push_decompressor( const String& filename, boost::iostreams::filtering_istream& in )
   {
#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_ZLIB
      if( boost::algorithm::ends_with( filename, ".gz" ) )
         in.push( boost::iostreams::gzip_decompressor() );
#endif
#ifdef BANDCLASS_USE_BOOST_IOSTREAMS_WITH_BZIP2
      if( boost::algorithm::ends_with( filename, ".bz2" ) )
         in.push( boost::iostreams::bzip2_decompressor() );
#endif
   }

   /// spreadsheet programs prefix UTF-8 exports with a byte order mark
   static void
   strip_byte_order_mark( String& strline )
   {
      if( boost::algorithm::starts_with( strline, "\xEF\xBB\xBF" ) )
         strline.erase( 0, 3 );
   }

   /// only the first line holding fields may be a header
   static bool
   line_is_header( const Vec<String>& tokens, std::initializer_list<const char*> keys )
   {
      for( const char* key : keys )
         if( boost::iequals( tokens[0], key ) )
            return true;
      return false;
   }

   /// splits at commas, trims every field and drops empty trailing fields
   static Vec<String>
   split( const String& strline )
   {
      Vec<String> tokens;
      String stripped = boost::trim_copy( strline );
      if( stripped.empty() || stripped[0] == '#' )
         return tokens;

      boost::split( tokens, stripped, boost::is_any_of( "," ) );
      for( String& token : tokens )
         boost::trim( token );
      while( !tokens.empty() && tokens.back().empty() )
         tokens.pop_back();

      return tokens;
   }
};

} // namespace bandclass

#endif
