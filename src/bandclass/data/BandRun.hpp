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

#ifndef __BANDCLASS_DATA_BANDRUN_HPP__
#define __BANDCLASS_DATA_BANDRUN_HPP__

#include "bandclass/data/BandData.hpp"
#include "bandclass/data/BandParameters.hpp"
#include "bandclass/io/AssignmentWriter.hpp"
#include "bandclass/io/BandReader.hpp"
#include "bandclass/io/Message.hpp"
#include "bandclass/misc/Exceptions.hpp"
#include "bandclass/misc/OptionsParser.hpp"
#include "bandclass/model/AssignmentSolver.hpp"
#include "bandclass/model/ResultShaper.hpp"


namespace bandclass
{
   enum BandExitCode : int
   {
      kSuccess          = 0,
      kInvalidInput     = 1,
      kInfeasible       = 2,
      kSolverFailure    = 3,
   };

   template <typename REAL>
   class BandRun
   {
   private:

      const Message& msg;
      const BandParameters& parameters;
      const std::shared_ptr<SolverFactory<REAL>>& factory;

   public:

      explicit BandRun(const Message& _msg, const BandParameters& _parameters, const std::shared_ptr<SolverFactory<REAL>>& _factory)
            : msg(_msg), parameters(_parameters), factory(_factory) { }

      int
      apply(const OptionsInfo& optionsInfo)
      {
         try
         {
            msg.info("\nMIP Solver:\n");
            factory->create_solver(msg)->print_header();
            msg.info("\n");

            InstrumentTargets targets = BandReader::readTargets(optionsInfo.instruments_file);
            StudentPreferences preferences = BandReader::readPreferences(optionsInfo.students_file);
            msg.info("read {} instruments from {}\n", targets.size(), optionsInfo.instruments_file);
            msg.info("read {} students from {}\n\n", preferences.size(), optionsInfo.students_file);

            if( optionsInfo.compare )
               return compare(targets, preferences);

            auto mode = parsePreferenceMode(optionsInfo.mode);
            if( !mode )
               throw InvalidInput(fmt::format("unknown preference mode {}", optionsInfo.mode));
            return assign(targets, preferences, mode.get(), optionsInfo.output_prefix);
         }
         catch( const InvalidInput& e )
         {
            msg.error("invalid input: {}\n", e.what());
            return kInvalidInput;
         }
         catch( const SolverError& e )
         {
            msg.error("solver error: {}\n", e.what());
            return kSolverFailure;
         }
         catch( const InternalConsistency& e )
         {
            msg.error("internal error: {}\n", e.what());
            return kSolverFailure;
         }
      }

   private:

      int
      assign(const InstrumentTargets& targets, const StudentPreferences& preferences, PreferenceMode mode,
             const String& output_prefix) const
      {
         String suffix = output_prefix.empty() ? String() : AssignmentWriter::getCompressionSuffix(parameters.output_compression);
         AssignmentResult<REAL> result = AssignmentSolver<REAL>(msg, parameters, factory).solve(targets, preferences, mode);

         if( result.isInfeasible() )
         {
            msg.info("no assignment satisfies the constraints of mode {}\n", mode);
            return kInfeasible;
         }
         if( !result.isFeasible() )
         {
            msg.error("mode {} stopped with status {} before an assignment was found\n", mode, result.status);
            return kSolverFailure;
         }

         LongAssignment rows = ResultShaper::toLongForm(*result.assignment, preferences);
         SectionSummary summary = ResultShaper::summarizeSections(rows, targets);
         msg.info("preference cost {} section deviation {}\n", ResultShaper::getPreferenceCost(rows),
                  ResultShaper::getSectionDeviation(summary));

         if( output_prefix.empty() )
            AssignmentWriter::log(msg, rows, summary);
         else
         {
            String assignment_file = output_prefix + "_assignment.csv" + suffix;
            String sections_file = output_prefix + "_sections.csv" + suffix;
            AssignmentWriter::writeAssignment(assignment_file, rows);
            AssignmentWriter::writeSections(sections_file, summary);
            msg.info("wrote {} and {}\n", assignment_file, sections_file);
         }

         return kSuccess;
      }

      int
      compare(const InstrumentTargets& targets, const StudentPreferences& preferences) const
      {
         AssignmentSolver<REAL> solver(msg, parameters, factory);
         Vec<AssignmentResult<REAL>> results;
         for( PreferenceMode mode : allPreferenceModes() )
            results.push_back(solver.solve(targets, preferences, mode));

         bool found = false;
         msg.info("\n{:<16} {:<24} {:>12} {:>16} {:>18} {:>10}\n", "mode", "status", "objective", "preference cost",
                  "section deviation", "time");
         for( const auto& result : results )
         {
            if( !result.isFeasible() )
            {
               msg.info("{:<16} {:<24} {:>12} {:>16} {:>18} {:>10.3f}\n", result.mode, result.status, "-", "-", "-",
                        result.time);
               continue;
            }
            found = true;
            LongAssignment rows = ResultShaper::toLongForm(*result.assignment, preferences);
            SectionSummary summary = ResultShaper::summarizeSections(rows, targets);
            msg.info("{:<16} {:<24} {:>12} {:>16} {:>18} {:>10.3f}\n", result.mode, result.status, result.objective,
                     ResultShaper::getPreferenceCost(rows), ResultShaper::getSectionDeviation(summary), result.time);
         }

         return found ? kSuccess : kInfeasible;
      }
   };

} // namespace bandclass

#endif
