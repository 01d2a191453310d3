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

#ifndef _BANDCLASS_DATA_BAND_DATA_HPP_
#define _BANDCLASS_DATA_BAND_DATA_HPP_

#include "bandclass/misc/Exceptions.hpp"
#include "bandclass/misc/Hash.hpp"
#include "bandclass/misc/String.hpp"
#include "bandclass/misc/Vec.hpp"
#include "bandclass/misc/fmt.hpp"
#include <initializer_list>
#include <utility>

namespace bandclass
{

/// ideal headcount per instrument, in insertion order
class InstrumentTargets
{
 public:
   InstrumentTargets() = default;

   InstrumentTargets( std::initializer_list<std::pair<String, int>> targets )
   {
      for( const auto& target : targets )
         add( target.first, target.second );
   }

   /// adds an instrument, throws InvalidInput if the name is already taken
   void
   add( const String& instrument, int count )
   {
      if( !index.emplace( instrument, static_cast<int>( names.size() ) ).second )
         throw InvalidInput(
             fmt::format( "instrument '{}' is listed twice", instrument ) );
      names.push_back( instrument );
      counts.push_back( count );
   }

   int
   size() const
   {
      return static_cast<int>( names.size() );
   }

   bool
   empty() const
   {
      return names.empty();
   }

   /// index of the instrument or -1 if unknown
   int
   find( const String& instrument ) const
   {
      auto it = index.find( instrument );
      return it == index.end() ? -1 : it->second;
   }

   const Vec<String>&
   getNames() const
   {
      return names;
   }

   const String&
   getName( int instrument ) const
   {
      return names[instrument];
   }

   int
   getCount( int instrument ) const
   {
      return counts[instrument];
   }

 private:
   Vec<String> names;
   Vec<int> counts;
   HashMap<String, int> index;
};

/// ranked instrument choices per student, most preferred first
class StudentPreferences
{
 public:
   StudentPreferences() = default;

   StudentPreferences(
       std::initializer_list<std::pair<String, Vec<String>>> preferences )
   {
      for( const auto& preference : preferences )
         add( preference.first, preference.second );
   }

   /// adds a student, throws InvalidInput if the name is already taken
   void
   add( const String& student, Vec<String> choices )
   {
      if( !index.emplace( student, static_cast<int>( students.size() ) ).second )
         throw InvalidInput(
             fmt::format( "student '{}' is listed twice", student ) );
      students.push_back( student );
      preferences.push_back( std::move( choices ) );
   }

   int
   size() const
   {
      return static_cast<int>( students.size() );
   }

   bool
   empty() const
   {
      return students.empty();
   }

   /// index of the student or -1 if unknown
   int
   find( const String& student ) const
   {
      auto it = index.find( student );
      return it == index.end() ? -1 : it->second;
   }

   const Vec<String>&
   getNames() const
   {
      return students;
   }

   const String&
   getName( int student ) const
   {
      return students[student];
   }

   const Vec<String>&
   getChoices( int student ) const
   {
      return preferences[student];
   }

   /// 0-based position of the instrument in the list of the student or -1
   int
   getRank( int student, const String& instrument ) const
   {
      const Vec<String>& choices = preferences[student];
      for( int rank = 0; rank < static_cast<int>( choices.size() ); ++rank )
         if( choices[rank] == instrument )
            return rank;
      return -1;
   }

 private:
   Vec<String> students;
   Vec<Vec<String>> preferences;
   HashMap<String, int> index;
};

/// checks the structural invariants of a band instance and throws
/// InvalidInput naming the offending student or instrument
inline void
validate( const InstrumentTargets& targets, const StudentPreferences& preferences )
{
   if( targets.empty() )
      throw InvalidInput( "no instruments given" );

   for( int i = 0; i < targets.size(); ++i )
   {
      if( targets.getName( i ).empty() )
         throw InvalidInput( fmt::format( "instrument {} has no name", i + 1 ) );
      if( targets.getCount( i ) < 0 )
         throw InvalidInput(
             fmt::format( "instrument '{}' has negative target count {}",
                          targets.getName( i ), targets.getCount( i ) ) );
   }

   if( preferences.empty() )
      throw InvalidInput( "no students given" );

   for( int s = 0; s < preferences.size(); ++s )
   {
      const String& student = preferences.getName( s );
      const Vec<String>& choices = preferences.getChoices( s );

      if( student.empty() )
         throw InvalidInput( fmt::format( "student {} has no name", s + 1 ) );
      if( choices.empty() )
         throw InvalidInput(
             fmt::format( "student '{}' has no instrument preference", student ) );

      HashSet<String> seen;
      for( const String& instrument : choices )
      {
         if( targets.find( instrument ) < 0 )
            throw InvalidInput( fmt::format(
                "student '{}' prefers unknown instrument '{}'", student,
                instrument ) );
         if( !seen.insert( instrument ).second )
            throw InvalidInput(
                fmt::format( "student '{}' lists instrument '{}' twice",
                             student, instrument ) );
      }
   }
}

} // namespace bandclass

#endif
