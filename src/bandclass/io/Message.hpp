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

#ifndef _BANDCLASS_IO_MESSAGE_HPP_
#define _BANDCLASS_IO_MESSAGE_HPP_

#include "bandclass/misc/ParameterSet.hpp"
#include "bandclass/misc/fmt.hpp"
#include <cstdio>
#include <iterator>
#include <utility>

namespace bandclass
{

enum class VerbosityLevel : int
{
   kQuiet = 0,
   kError = 1,
   kWarning = 2,
   kInfo = 3,
   kDetailed = 4,
};

/// formats messages with fmt and forwards those at or below the current
/// verbosity to stdout or to a user callback
class Message
{
 public:
   using OutputCallback = void ( * )( VerbosityLevel level, const char* data,
                                      std::size_t size, void* usrptr );

   void
   addParameters( ParameterSet& paramSet )
   {
      paramSet.addParameter(
          "message.verbosity",
          "verbosity to be used. 0 - quiet, 1 - errors, 2 - warnings, "
          "3 - normal, 4 - detailed",
          verbosity, 0, 4 );
   }

   void
   setVerbosityLevel( VerbosityLevel value )
   {
      verbosity = static_cast<int>( value );
   }

   VerbosityLevel
   getVerbosityLevel() const
   {
      return static_cast<VerbosityLevel>( verbosity );
   }

   void
   setOutputCallback( OutputCallback callback, void* usrptr_ = nullptr )
   {
      outputcallback = callback;
      usrptr = usrptr_;
   }

   template <typename... Args>
   void
   print( VerbosityLevel level, const char* format, Args&&... args ) const
   {
      if( static_cast<int>( level ) > verbosity )
         return;

      fmt::memory_buffer buf;
      fmt::vformat_to( std::back_inserter( buf ), fmt::string_view( format ),
                       fmt::make_format_args( args... ) );

      if( outputcallback == nullptr )
         fwrite( buf.data(), 1, buf.size(), stdout );
      else
         outputcallback( level, buf.data(), buf.size(), usrptr );
   }

   template <typename... Args>
   void
   error( const char* format, Args&&... args ) const
   {
      print( VerbosityLevel::kError, format, std::forward<Args>( args )... );
   }

   template <typename... Args>
   void
   warn( const char* format, Args&&... args ) const
   {
      print( VerbosityLevel::kWarning, format, std::forward<Args>( args )... );
   }

   template <typename... Args>
   void
   info( const char* format, Args&&... args ) const
   {
      print( VerbosityLevel::kInfo, format, std::forward<Args>( args )... );
   }

   template <typename... Args>
   void
   detailed( const char* format, Args&&... args ) const
   {
      print( VerbosityLevel::kDetailed, format,
             std::forward<Args>( args )... );
   }

 private:
   int verbosity = static_cast<int>( VerbosityLevel::kInfo );
   OutputCallback outputcallback = nullptr;
   void* usrptr = nullptr;
};

} // namespace bandclass

#endif
