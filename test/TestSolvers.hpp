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

#ifndef _BANDCLASS_TEST_TEST_SOLVERS_HPP_
#define _BANDCLASS_TEST_TEST_SOLVERS_HPP_

#include "bandclass/interfaces/SolverInterface.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>

namespace bandclass
{

/// exact solver for binary problems with few columns, tries every 0/1 vector
class EnumerationSolver : public SolverInterface<double>
{
 public:
   explicit EnumerationSolver( const Message& _msg ) : SolverInterface<double>( _msg ) {}

   void
   doSetUp( const Problem<double>& problem ) override
   {
      if( problem.getNCols() > 24 )
         throw std::invalid_argument( "too many columns to enumerate" );
      model = &problem;
   }

   std::pair<char, SolverStatus>
   solve() override
   {
      int ncols = model->getNCols();
      Solution<double> candidate( Vec<double>( ncols, 0.0 ) );
      bool found = false;

      for( uint32_t mask = 0; mask < ( uint32_t{ 1 } << ncols ); ++mask )
      {
         for( int col = 0; col < ncols; ++col )
            candidate.primal[col] = ( mask >> col ) & 1u ? 1.0 : 0.0;
         if( check_primal_solution( candidate, 1e-9 ) != OKAY )
            continue;
         double objective = model->getPrimalObjective( candidate );
         if( !found || objective < value )
         {
            found = true;
            value = objective;
            solution = candidate;
         }
      }

      if( !found )
      {
         solution = Solution<double>( SolutionStatus::kInfeasible );
         return { OKAY, SolverStatus::kInfeasible };
      }
      return { OKAY, SolverStatus::kOptimal };
   }
};

/// returns a fixed primal vector regardless of the problem, an empty vector claims infeasibility
class FixedSolver : public SolverInterface<double>
{
 public:
   FixedSolver( const Message& _msg, Vec<double> _primal, char _retcode )
       : SolverInterface<double>( _msg ), primal( std::move( _primal ) ), retcode( _retcode )
   {
   }

   void
   doSetUp( const Problem<double>& problem ) override
   {
      model = &problem;
   }

   std::pair<char, SolverStatus>
   solve() override
   {
      if( retcode < 0 )
         return { retcode, SolverStatus::kUndefinedError };
      if( primal.empty() )
      {
         solution = Solution<double>( SolutionStatus::kInfeasible );
         return { retcode, SolverStatus::kInfeasible };
      }
      solution = Solution<double>( primal );
      value = 0.0;
      return { retcode, SolverStatus::kOptimal };
   }

 private:
   Vec<double> primal;
   char retcode;
};

class EnumerationFactory : public SolverFactory<double>
{
 public:
   void
   addParameters( ParameterSet& ) override
   {
   }

   std::unique_ptr<SolverInterface<double>>
   create_solver( const Message& msg ) override
   {
      ++created;
      return std::unique_ptr<SolverInterface<double>>( new EnumerationSolver( msg ) );
   }

   int created = 0;
};

class FixedFactory : public SolverFactory<double>
{
 public:
   FixedFactory( Vec<double> _primal, char _retcode = OKAY )
       : primal( std::move( _primal ) ), retcode( _retcode )
   {
   }

   void
   addParameters( ParameterSet& ) override
   {
   }

   std::unique_ptr<SolverInterface<double>>
   create_solver( const Message& msg ) override
   {
      return std::unique_ptr<SolverInterface<double>>( new FixedSolver( msg, primal, retcode ) );
   }

 private:
   Vec<double> primal;
   char retcode;
};

} // namespace bandclass

#endif
