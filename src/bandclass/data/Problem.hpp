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

#ifndef _BANDCLASS_CORE_PROBLEM_HPP_
#define _BANDCLASS_CORE_PROBLEM_HPP_

#include "bandclass/data/ConstraintMatrix.hpp"
#include "bandclass/data/Objective.hpp"
#include "bandclass/data/Solution.hpp"
#include "bandclass/data/VariableDomains.hpp"
#include "bandclass/misc/String.hpp"
#include "bandclass/misc/Vec.hpp"
#include <cassert>
#include <utility>

namespace bandclass
{

/// class representing the problem consisting of the constraint matrix, the left
/// and right hand side values, the variable domains, the column bounds,
/// column integrality restrictions, and the objective function
template <typename REAL>
class Problem
{
 public:
   /// set objective function
   void
   setObjective( Objective<REAL>&& obj )
   {
      objective = std::move( obj );
   }

   /// set constraint matrix
   void
   setConstraintMatrix( ConstraintMatrix<REAL>&& cons_matrix )
   {
      constraintMatrix = std::move( cons_matrix );
   }

   /// set domains of variables
   void
   setVariableDomains( VariableDomains<REAL>&& domains )
   {
      variableDomains = std::move( domains );

      nintegers = 0;
      for( const ColFlags& cf : variableDomains.flags )
         if( cf.test( ColFlag::kIntegral ) )
            ++nintegers;
   }

   /// set problem name
   void
   setName( String name_ )
   {
      name = std::move( name_ );
   }

   /// set variable names
   void
   setVariableNames( Vec<String> var_names )
   {
      variableNames = std::move( var_names );
   }

   /// set constraint names
   void
   setConstraintNames( Vec<String> cons_names )
   {
      constraintNames = std::move( cons_names );
   }

   /// returns number of integral columns
   int
   getNumIntegralCols() const
   {
      return nintegers;
   }

   const ConstraintMatrix<REAL>&
   getConstraintMatrix() const
   {
      return constraintMatrix;
   }

   int
   getNCols() const
   {
      return static_cast<int>( variableDomains.flags.size() );
   }

   int
   getNRows() const
   {
      return constraintMatrix.getNRows();
   }

   const Objective<REAL>&
   getObjective() const
   {
      return objective;
   }

   const VariableDomains<REAL>&
   getVariableDomains() const
   {
      return variableDomains;
   }

   const Vec<ColFlags>&
   getColFlags() const
   {
      return variableDomains.flags;
   }

   const Vec<RowFlags>&
   getRowFlags() const
   {
      return constraintMatrix.getRowFlags();
   }

   const Vec<REAL>&
   getLowerBounds() const
   {
      return variableDomains.lower_bounds;
   }

   const Vec<REAL>&
   getUpperBounds() const
   {
      return variableDomains.upper_bounds;
   }

   const String&
   getName() const
   {
      return name;
   }

   const Vec<String>&
   getVariableNames() const
   {
      return variableNames;
   }

   const Vec<String>&
   getConstraintNames() const
   {
      return constraintNames;
   }

   /// get primal objective value for given solution including the offset
   REAL
   getPrimalObjective( const Solution<REAL>& solution ) const
   {
      assert( solution.status == SolutionStatus::kFeasible );
      assert( static_cast<int>( solution.primal.size() ) == getNCols() );
      const auto& data = getObjective().coefficients;
      REAL sum { getObjective().offset };
      for( int i = 0; i < getNCols(); ++i )
         sum += data[i] * solution.primal[i];
      return sum;
   }

   /// get activity of the given row for given solution
   REAL
   getPrimalActivity( const Solution<REAL>& solution, int row ) const
   {
      assert( solution.status == SolutionStatus::kFeasible );
      assert( static_cast<int>( solution.primal.size() ) == getNCols() );
      const auto& data = getConstraintMatrix().getRowCoefficients( row );
      REAL sum { 0 };
      for( int i = 0; i < data.getLength(); ++i )
         sum += data.getValues()[i] * solution.primal[data.getIndices()[i]];
      return sum;
   }

 private:
   String name;
   Objective<REAL> objective;
   ConstraintMatrix<REAL> constraintMatrix;
   VariableDomains<REAL> variableDomains;
   int nintegers = 0;
   Vec<String> variableNames;
   Vec<String> constraintNames;
};

} // namespace bandclass

#endif
