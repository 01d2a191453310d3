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

#ifndef __BANDCLASS_MODEL_ASSIGNMENTSOLVER_HPP__
#define __BANDCLASS_MODEL_ASSIGNMENTSOLVER_HPP__

#include "bandclass/data/Assignment.hpp"
#include "bandclass/data/BandData.hpp"
#include "bandclass/data/BandParameters.hpp"
#include "bandclass/data/PreferenceMode.hpp"
#include "bandclass/interfaces/SolverInterface.hpp"
#include "bandclass/interfaces/SolverStatus.hpp"
#include "bandclass/io/Message.hpp"
#include "bandclass/misc/Exceptions.hpp"
#include "bandclass/misc/Timer.hpp"
#include "bandclass/model/AssignmentModel.hpp"
#include <boost/optional.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>


namespace bandclass
{
   template <typename REAL>
   struct AssignmentResult
   {
      PreferenceMode mode = PreferenceMode::kBalanced;
      SolverStatus status = SolverStatus::kUnknown;
      boost::optional<WideAssignment> assignment { };
      REAL objective { std::numeric_limits<REAL>::quiet_NaN() };
      double time = 0.0;

      bool
      isFeasible( ) const
      {
         return assignment.is_initialized();
      }

      bool
      isInfeasible( ) const
      {
         return bandclass::isInfeasible(status);
      }
   };

   /**
    * solves one band instance for one preference mode, each call on a fresh solver
    * @tparam REAL arithmetic type of the solver
    */
   template <typename REAL>
   class AssignmentSolver
   {
   private:

      const Message& msg;
      const BandParameters& parameters;
      const std::shared_ptr<SolverFactory<REAL>>& factory;

   public:

      AssignmentSolver(const Message& _msg, const BandParameters& _parameters, const std::shared_ptr<SolverFactory<REAL>>& _factory)
            : msg(_msg), parameters(_parameters), factory(_factory) { }

      AssignmentResult<REAL>
      solve(const InstrumentTargets& targets, const StudentPreferences& preferences, PreferenceMode mode) const
      {
         bandclass::validate(targets, preferences);

         AssignmentResult<REAL> result;
         result.mode = mode;
         WeightConfig weights = parameters.getWeightConfig(mode);
         Problem<REAL> problem = AssignmentModel<REAL>::build(targets, preferences, weights, parameters);
         msg.info("Mode {}: {} students, {} instruments, {} variables, {} constraints\n", mode,
                  preferences.size(), targets.size(), problem.getNCols(), problem.getNRows());
         msg.detailed("\tweights: composition {} preference {} section bounds {}\n", weights.composition_weight,
                      weights.preference_weight, weights.apply_section_bounds ? "on" : "off");

         auto solver = factory->create_solver(msg);
         if( solver == nullptr )
            throw SolverError("solver could not be created");
         solver->doSetUp(problem);
         if( !parameters.debug_filename.empty() && !solver->writeInstance(parameters.debug_filename) )
            msg.warn("could not write model to {}\n", parameters.debug_filename);

         std::pair<char, SolverStatus> answer;
         {
            Timer timer(result.time);
            answer = solver->solve();
         }
         result.status = answer.second;

         if( answer.first < 0 )
            throw SolverError(fmt::format("solver failed with error code {}", static_cast<int>(answer.first)));
         if( answer.first == PRIMALFAIL )
            throw InternalConsistency("solver returned a solution violating the model");
         if( answer.first == OBJECTIVEFAIL )
            throw InternalConsistency("solver returned an objective value not matching its solution");

         if( result.time > 1.0 )
            msg.info("Mode {} finished {} in {:.3f} seconds\n", mode, result.status, result.time);
         else
            msg.info("Mode {} finished {} in {:.1f} milliseconds\n", mode, result.status, result.time * 1000.0);

         const Solution<REAL>& solution = solver->getSolution();
         if( result.isInfeasible() || solution.status != SolutionStatus::kFeasible )
         {
            if( !result.isInfeasible() )
               msg.warn("Mode {} stopped without an assignment\n", mode);
            return result;
         }

         result.assignment = round(problem, solution, targets, preferences);
         result.objective = problem.getPrimalObjective(toSolution(*result.assignment));
         msg.info("Objective value {}\n", result.objective);
         return result;
      }

   private:

      /// rounds the primal values to 0/1 within the feasibility tolerance and checks the result against the model
      WideAssignment
      round(const Problem<REAL>& problem, const Solution<REAL>& solution, const InstrumentTargets& targets,
            const StudentPreferences& preferences) const
      {
         if( static_cast<int>(solution.primal.size()) != problem.getNCols() )
            throw InternalConsistency(fmt::format("solution has {} instead of {} values", solution.primal.size(),
                                                  problem.getNCols()));

         Vec<uint8_t> values(solution.primal.size());

         for( int col = 0; col < problem.getNCols(); ++col )
         {
            const REAL& val = solution.primal[col];
            if( std::abs(val - REAL{ 1 }) <= parameters.feastol )
               values[col] = 1;
            else if( std::abs(val) > parameters.feastol )
               throw InternalConsistency(fmt::format("column {} has fractional value {}",
                                                     problem.getVariableNames()[col], val));
         }

         WideAssignment assignment(preferences.getNames(), targets.getNames(), std::move(values));

         for( int s = 0; s < preferences.size(); ++s )
         {
            if( assignment.getNAssigned(s) != 1 )
               throw InternalConsistency(fmt::format("student '{}' is assigned {} instruments",
                                                     preferences.getName(s), assignment.getNAssigned(s)));
            int instrument = assignment.getAssignedInstrument(s);
            if( preferences.getRank(s, targets.getName(instrument)) < 0 )
               throw InternalConsistency(fmt::format("student '{}' is assigned unlisted instrument '{}'",
                                                     preferences.getName(s), targets.getName(instrument)));
         }

         const auto& matrix = problem.getConstraintMatrix();
         Solution<REAL> rounded = toSolution(assignment);
         for( int row = 0; row < problem.getNRows(); ++row )
         {
            REAL activity = problem.getPrimalActivity(rounded, row);
            if( ( !problem.getRowFlags()[row].test(RowFlag::kLhsInf) && activity < matrix.getLeftHandSides()[row] - parameters.feastol )
             || ( !problem.getRowFlags()[row].test(RowFlag::kRhsInf) && activity > matrix.getRightHandSides()[row] + parameters.feastol ) )
               throw InternalConsistency(fmt::format("assignment violates constraint {}", problem.getConstraintNames()[row]));
         }

         return assignment;
      }

      static Solution<REAL>
      toSolution(const WideAssignment& assignment)
      {
         Vec<REAL> primal;
         primal.reserve(assignment.getNStudents() * assignment.getNInstruments());
         for( int s = 0; s < assignment.getNStudents(); ++s )
            for( int i = 0; i < assignment.getNInstruments(); ++i )
               primal.push_back(assignment.isAssigned(s, i) ? REAL{ 1 } : REAL{ 0 });
         return Solution<REAL>(std::move(primal));
      }
   };

} // namespace bandclass

#endif
