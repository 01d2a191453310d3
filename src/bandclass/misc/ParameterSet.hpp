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

#ifndef _BANDCLASS_MISC_PARAMETER_SET_HPP_
#define _BANDCLASS_MISC_PARAMETER_SET_HPP_

#include "bandclass/misc/String.hpp"
#include "bandclass/misc/fmt.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/variant.hpp>
#include <cassert>
#include <climits>
#include <limits>
#include <map>
#include <ostream>
#include <stdexcept>

namespace bandclass
{

/// collection of named references to tunable values; the referenced variables
/// must outlive the set
class ParameterSet
{
   struct BoolParameter
   {
      bool* value;
   };

   struct IntParameter
   {
      int* value;
      int min;
      int max;
   };

   struct DoubleParameter
   {
      double* value;
      double min;
      double max;
   };

   struct StringParameter
   {
      String* value;
   };

   struct Parameter
   {
      String description;
      boost::variant<BoolParameter, IntParameter, DoubleParameter,
                     StringParameter>
          value;
   };

   class ParseVisitor : public boost::static_visitor<>
   {
    public:
      ParseVisitor( const String& _name, const String& _value )
          : name( _name ), value( _value )
      {
      }

      void
      operator()( const BoolParameter& param ) const
      {
         if( boost::iequals( value, "true" ) || value == "1" ||
             boost::iequals( value, "on" ) )
            *param.value = true;
         else if( boost::iequals( value, "false" ) || value == "0" ||
                  boost::iequals( value, "off" ) )
            *param.value = false;
         else
            throw std::invalid_argument( fmt::format(
                "value '{}' of parameter {} is not a boolean", value, name ) );
      }

      void
      operator()( const IntParameter& param ) const
      {
         int parsed;
         if( !boost::conversion::try_lexical_convert( value, parsed ) )
            throw std::invalid_argument( fmt::format(
                "value '{}' of parameter {} is not an integer", value, name ) );
         if( parsed < param.min || parsed > param.max )
            throw std::out_of_range(
                fmt::format( "value {} of parameter {} is outside [{},{}]",
                             parsed, name, param.min, param.max ) );
         *param.value = parsed;
      }

      void
      operator()( const DoubleParameter& param ) const
      {
         double parsed;
         if( !boost::conversion::try_lexical_convert( value, parsed ) )
            throw std::invalid_argument( fmt::format(
                "value '{}' of parameter {} is not a number", value, name ) );
         if( parsed < param.min || parsed > param.max )
            throw std::out_of_range(
                fmt::format( "value {} of parameter {} is outside [{},{}]",
                             parsed, name, param.min, param.max ) );
         *param.value = parsed;
      }

      void
      operator()( const StringParameter& param ) const
      {
         *param.value = value;
      }

    private:
      const String& name;
      const String& value;
   };

   class PrintVisitor : public boost::static_visitor<String>
   {
    public:
      String
      operator()( const BoolParameter& param ) const
      {
         return *param.value ? "true" : "false";
      }

      String
      operator()( const IntParameter& param ) const
      {
         return fmt::format( "{}", *param.value );
      }

      String
      operator()( const DoubleParameter& param ) const
      {
         return fmt::format( "{}", *param.value );
      }

      String
      operator()( const StringParameter& param ) const
      {
         return *param.value;
      }
   };

 public:
   void
   addParameter( const char* name, const char* description, bool& value )
   {
      insert( name, Parameter{ description, BoolParameter{ &value } } );
   }

   void
   addParameter( const char* name, const char* description, int& value,
                 int min = INT_MIN, int max = INT_MAX )
   {
      assert( min <= value && value <= max );
      insert( name, Parameter{ description, IntParameter{ &value, min, max } } );
   }

   void
   addParameter( const char* name, const char* description, double& value,
                 double min = std::numeric_limits<double>::lowest(),
                 double max = std::numeric_limits<double>::max() )
   {
      assert( min <= value && value <= max );
      insert( name,
              Parameter{ description, DoubleParameter{ &value, min, max } } );
   }

   void
   addParameter( const char* name, const char* description, String& value )
   {
      insert( name, Parameter{ description, StringParameter{ &value } } );
   }

   /// sets the parameter with the given name from its textual value, throws
   /// std::invalid_argument for unknown names or malformed values and
   /// std::out_of_range for values outside the admissible range
   void
   parseParameter( const char* name, const char* value )
   {
      auto it = parameters.find( name );
      if( it == parameters.end() )
         throw std::invalid_argument(
             fmt::format( "unknown parameter {}", name ) );

      boost::apply_visitor( ParseVisitor( it->first, String( value ) ),
                            it->second.value );
   }

   /// parses one line of a parameter file; comments start with '#'
   /// and lines without '=' are ignored, returns whether a value was set
   bool
   parseLine( String line )
   {
      std::size_t pos = line.find_first_of( '#' );
      if( pos != String::npos )
         line = line.substr( 0, pos );

      pos = line.find_first_of( '=' );
      if( pos == String::npos )
         return false;

      String theoptionstr = line.substr( 0, pos );
      String thevaluestr = line.substr( pos + 1 );

      boost::algorithm::trim( theoptionstr );
      boost::algorithm::trim( thevaluestr );

      parseParameter( theoptionstr.c_str(), thevaluestr.c_str() );
      return true;
   }

   bool
   hasParameter( const String& name ) const
   {
      return parameters.count( name ) != 0;
   }

   String
   getValue( const String& name ) const
   {
      auto it = parameters.find( name );
      if( it == parameters.end() )
         throw std::invalid_argument(
             fmt::format( "unknown parameter {}", name ) );
      return boost::apply_visitor( PrintVisitor(), it->second.value );
   }

   void
   printParams( std::ostream& out ) const
   {
      for( const auto& param : parameters )
      {
         fmt::print( out, "# {}\n{} = {}\n\n", param.second.description,
                     param.first,
                     boost::apply_visitor( PrintVisitor(), param.second.value ) );
      }
   }

 private:
   void
   insert( const char* name, Parameter&& parameter )
   {
      if( !parameters.emplace( name, std::move( parameter ) ).second )
         throw std::invalid_argument(
             fmt::format( "parameter {} registered twice", name ) );
   }

   std::map<String, Parameter> parameters;
};

} // namespace bandclass

#endif
