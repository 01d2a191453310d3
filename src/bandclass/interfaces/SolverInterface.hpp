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

#ifndef __BANDCLASS_INTERFACES_SOLVERINTERFACE_HPP__
#define __BANDCLASS_INTERFACES_SOLVERINTERFACE_HPP__

#include "bandclass/data/Problem.hpp"
#include "bandclass/data/Solution.hpp"
#include "bandclass/interfaces/SolverStatus.hpp"
#include "bandclass/io/Message.hpp"
#include "bandclass/misc/ParameterSet.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <utility>


namespace bandclass
{
   enum SolverRetcode : char
   {
      OKAY              = 0,
      PRIMALFAIL        = 1,
      OBJECTIVEFAIL     = 2,
   };

   /**
    * API to access the solver
    * Optional methods are marked with **optional**. They should be implemented to enable further functionality.
    * @tparam REAL arithmetic type of problem and solution
    */
   template <typename REAL>
   class SolverInterface
   {
   protected:

      const Message& msg;
      const Problem<REAL>* model = nullptr;
      Solution<REAL> solution { };
      REAL value { std::numeric_limits<REAL>::quiet_NaN() };

   public:

      SolverInterface(const Message& _msg) : msg(_msg) { }

      /** **optional**
       * prints the header of the used solver
       * _if not implemented, then the solver specification will not be contained in the log_
       */
      virtual
      void
      print_header( ) const { }

      /**
       * loads the problem, which has to outlive the solver
       * @param problem
       */
      virtual
      void
      doSetUp(const Problem<REAL>& problem) = 0;

      /**
       * solves the instance
       * @return a pair<char, SolverStatus>: Negative values in the char are reserved for solver internal errors while the remaining ones are declared in SolverRetcode. The SolverStatus holds the solution status of the solve, for example infeasible or optimal.
       */
      virtual
      std::pair<char, SolverStatus>
      solve( ) = 0;

      /**
       * best solution of the last solve, status kInfeasible if proven infeasible, kUnknown if none was found
       */
      const Solution<REAL>&
      getSolution( ) const
      {
         return solution;
      }

      /** **optional**
       * write the loaded problem to a file in the format of the solver
       * @param filename without extension
       * @return whether the problem was written
       */
      virtual
      bool
      writeInstance(const String& filename) const
      {
         return false;
      }

      virtual
      ~SolverInterface() = default;

   protected:

      char
      check_primal_solution(const Solution<REAL>& candidate, const REAL& tolerance) const
      {
         if( candidate.status != SolutionStatus::kFeasible )
            return OKAY;

         if( static_cast<int>(candidate.primal.size()) != model->getNCols() )
         {
            msg.detailed( "\tSolution has {:<3} instead of {:<3} values\n", candidate.primal.size(), model->getNCols() );
            return PRIMALFAIL;
         }

         for( int col = 0; col < model->getNCols(); ++col )
         {
            const REAL& val = candidate.primal[col];

            if( ( !model->getColFlags()[col].test( ColFlag::kLbInf ) && val < model->getLowerBounds()[col] - tolerance )
             || ( !model->getColFlags()[col].test( ColFlag::kUbInf ) && val > model->getUpperBounds()[col] + tolerance )
             || ( model->getColFlags()[col].test( ColFlag::kIntegral ) && std::abs(val - std::round(val)) > tolerance ) )
            {
               msg.detailed( "\tColumn {:<3} outside domain (value {:<3})\n", model->getVariableNames()[col], val );
               return PRIMALFAIL;
            }
         }

         const auto& matrix = model->getConstraintMatrix();

         for( int row = 0; row < model->getNRows(); ++row )
         {
            REAL activity { model->getPrimalActivity(candidate, row) };

            if( ( !model->getRowFlags()[row].test( RowFlag::kLhsInf ) && activity < matrix.getLeftHandSides()[row] - tolerance )
             || ( !model->getRowFlags()[row].test( RowFlag::kRhsInf ) && activity > matrix.getRightHandSides()[row] + tolerance ) )
            {
               msg.detailed( "\tRow {:<3} outside range (activity {:<3})\n", model->getConstraintNames()[row], activity );
               return PRIMALFAIL;
            }
         }

         return OKAY;
      }

      char
      check_objective_value(const Solution<REAL>& candidate, const REAL& primal, const REAL& tolerance) const
      {
         if( candidate.status != SolutionStatus::kFeasible )
            return OKAY;

         REAL result { model->getPrimalObjective(candidate) };

         if( std::abs(primal - result) > tolerance * std::max(REAL{ 1 }, std::abs(result)) )
         {
            msg.detailed( "\tPrimal differs from solution ({:<3} != {:<3})\n", primal, result );
            return OBJECTIVEFAIL;
         }

         return OKAY;
      }
   };

   template <typename REAL>
   class SolverFactory
   {
   public:

      virtual
      void
      addParameters(ParameterSet& parameterset) = 0;

      virtual
      std::unique_ptr<SolverInterface<REAL>>
      create_solver(const Message& msg) = 0;

      virtual
      ~SolverFactory() = default;
   };

} // namespace bandclass

#endif
