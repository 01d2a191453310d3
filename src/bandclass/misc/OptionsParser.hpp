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

#ifndef _BANDCLASS_MISC_OPTIONS_PARSER_HPP_
#define _BANDCLASS_MISC_OPTIONS_PARSER_HPP_

#include "bandclass/data/PreferenceMode.hpp"
#include "bandclass/misc/fmt.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

BANDCLASS_OSTREAM_FORMATTER( boost::program_options::options_description )


namespace bandclass
{
   using namespace boost::program_options;

   struct OptionsInfo
   {
      std::string instruments_file;
      std::string students_file;
      std::string mode = "balanced";
      std::string param_settings_file;
      std::string output_prefix;
      bool compare = false;
      std::vector<std::string> unparsed_options;
      bool is_complete = false;
      bool is_help = false;

      bool
      checkFiles( )
      {
         if( instruments_file.empty( ) || fileNotFound(instruments_file) )
         {
            fmt::print("instrument file {} is not valid\n", instruments_file);
            return false;
         }

         if( students_file.empty( ) || fileNotFound(students_file) )
         {
            fmt::print("student file {} is not valid\n", students_file);
            return false;
         }

         if( fileNotFound(param_settings_file) )
         {
            fmt::print("file {} is not valid\n", param_settings_file);
            return false;
         }

         return true;
      }

      bool
      fileNotFound(const std::string &filename) const
      {
         return !filename.empty( ) && !std::ifstream(filename);
      }

      void
      parse(const std::vector<std::string> &opts = std::vector<std::string>( ))
      {
         is_complete = false;
         options_description desc(fmt::format(""));

         desc.add_options( )("instruments,i",
                             value(&instruments_file),
                             "csv file of instruments and their target counts");

         desc.add_options( )("students,s",
                             value(&students_file),
                             "csv file of students and their ranked instruments");

         desc.add_options( )("mode,m",
                             value(&mode),
                             "preference mode students, balanced or instrumentation");

         desc.add_options( )("parameters,p",
                             value(&param_settings_file),
                             "filename for bandclass parameters");

         desc.add_options( )("output,o",
                             value(&output_prefix),
                             "prefix of the assignment and section csv files");

         desc.add_options( )("compare,c",
                             bool_switch(&compare),
                             "solve all preference modes and compare them");

         if( opts.empty( ))
         {
            fmt::print("\n{}\n", desc);
            return;
         }

         variables_map vm;
         parsed_options parsed = command_line_parser(opts)
               .options(desc)
               .allow_unregistered( )
               .run( );
         store(parsed, vm);
         notify(vm);

         if( !checkFiles( ))
            return;

         if( !compare && !parsePreferenceMode(mode) )
         {
            fmt::print("mode {} is not valid\n", mode);
            return;
         }

         unparsed_options = collect_unrecognized(parsed.options, exclude_positional);
         is_complete = true;
      }
   };

   inline OptionsInfo
   parseOptions(int argc, char *argv[])
   {
      OptionsInfo optionsInfo;
      std::string usage =
            fmt::format("usage:\n {} -i INSTRUMENTS -s STUDENTS [ARGUMENTS]\n", argv[ 0 ]);

      // global description.
      // will capture the command and arguments as unrecognised
      options_description global { };
      global.add_options( )("help,h", "  produce help message");
      global.add_options( )("args", value<std::vector<std::string>>( ), "  arguments for the command");

      positional_options_description pos;
      pos.add("args", -1);

      parsed_options parsed = command_line_parser(argc, argv)
            .options(global)
            .positional(pos)
            .allow_unregistered( )
            .run( );

      variables_map vm;
      store(parsed, vm);

      if( vm.count("help") || vm.empty( ))
      {
         fmt::print("{}\n{}", usage, global);
         optionsInfo.is_help = true;
         optionsInfo.parse( );

         return optionsInfo;
      }

      std::vector<std::string> opts =
            collect_unrecognized(parsed.options, include_positional);

      optionsInfo.parse(opts);

      return optionsInfo;
   }

} // namespace bandclass

#endif
