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

#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

#include "bandclass/data/BandRun.hpp"
#include "bandclass/interfaces/ScipInterface.hpp"
#include "bandclass/misc/VersionLogger.hpp"

typedef double REAL;


using namespace bandclass;

int
main(int argc, char *argv[]) {

   print_header<REAL>( );

   // get the options passed by the user
   OptionsInfo optionsInfo;

   try
   {
      optionsInfo = parseOptions(argc, argv);
   }
   catch( const boost::program_options::error &ex )
   {
      std::cerr << "Error while parsing the options.\n" << '\n';
      std::cerr << ex.what( ) << '\n';
      return kInvalidInput;
   }

   if( !optionsInfo.is_complete )
      return optionsInfo.is_help ? kSuccess : kInvalidInput;

   Message msg { };
   BandParameters parameters { };

   std::shared_ptr<SolverFactory<REAL>> factory { load_solver_factory<REAL>() };

   if( !optionsInfo.param_settings_file.empty( ) || !optionsInfo.unparsed_options.empty( ) )
   {
      ParameterSet paramSet { };
      msg.addParameters(paramSet);
      parameters.addParameters(paramSet);
      factory->addParameters(paramSet);

      if( !optionsInfo.param_settings_file.empty( ) )
      {
         std::ifstream input(optionsInfo.param_settings_file);
         if( !input )
         {
            fmt::print("could not read parameter file '{}'\n",
                       optionsInfo.param_settings_file);
            return kInvalidInput;
         }

         for( bandclass::String line; getline(input, line); )
         {
            try
            {
               if( paramSet.parseLine(line) )
                  fmt::print("set {}\n", line);
            }
            catch( const std::exception &e )
            {
               fmt::print("parameter '{}' could not be set: {}\n", line,
                          e.what( ));
               return kInvalidInput;
            }
         }
      }

      for( const auto &option: optionsInfo.unparsed_options )
      {
         std::size_t pos = option.find_first_of('=');
         if( pos == bandclass::String::npos || pos <= 2 || option.compare(0, 2, "--") != 0 )
         {
            fmt::print("parameter '{}' could not be set: value expected\n",
                       option);
            return kInvalidInput;
         }

         bandclass::String theoptionstr = option.substr(2, pos - 2);
         bandclass::String thevaluestr = option.substr(pos + 1);
         try
         {
            paramSet.parseParameter(theoptionstr.c_str( ),
                                    thevaluestr.c_str( ));
            fmt::print("set {} = {}\n", theoptionstr, thevaluestr);
         }
         catch( const std::exception &e )
         {
            fmt::print("parameter '{}' could not be set: {}\n",
                       option, e.what( ));
            return kInvalidInput;
         }
      }

      if( msg.getVerbosityLevel( ) == VerbosityLevel::kDetailed )
      {
         fmt::print("\nparameters:\n");
         paramSet.printParams(std::cout);
      }
   }

   return BandRun<REAL>( msg, parameters, factory ).apply( optionsInfo );
}
