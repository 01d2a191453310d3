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

#ifndef __BANDCLASS_INTERFACES_SCIPINTERFACE_HPP__
#define __BANDCLASS_INTERFACES_SCIPINTERFACE_HPP__

#include "scip/scip.h"
#include "scip/scipdefplugins.h"
#include "bandclass/data/Problem.hpp"
#include "bandclass/interfaces/SolverStatus.hpp"
#include "bandclass/interfaces/SolverInterface.hpp"
#include "bandclass/misc/Exceptions.hpp"
#include <cassert>
#include <stdexcept>


namespace bandclass
{
   class ScipParameters
   {
   public:

      static constexpr const char* VERB = "display/verblevel";
      static constexpr const char* TIME = "limits/time";
      static constexpr const char* GAP = "limits/gap";

      double timelimit = -1.0;
      double gaplimit = 0.0;
   };

   template <typename REAL>
   class ScipInterface : public SolverInterface<REAL>
   {
   protected:

      const ScipParameters& parameters;
      SCIP* scip = nullptr;
      Vec<SCIP_VAR*> vars { };

   public:

      ScipInterface(const Message& _msg, const ScipParameters& _parameters) :
                    SolverInterface<REAL>(_msg), parameters(_parameters)
      {
         if( SCIPcreate(&scip) != SCIP_OKAY || SCIPincludeDefaultPlugins(scip) != SCIP_OKAY )
            throw SolverError("could not create SCIP");
      }

      void
      print_header( ) const override
      {
         SCIPprintVersion(scip, nullptr);

         auto names = SCIPgetExternalCodeNames(scip);
         auto description = SCIPgetExternalCodeDescriptions(scip);
         int length = SCIPgetNExternalCodes(scip);

         for( int i = 0; i < length; ++i )
            this->msg.info("\t{:20} {}\n", names[i], description[i]);
      }

      void
      doSetUp(const Problem<REAL>& problem) override
      {
         this->model = &problem;
         int ncols = this->model->getNCols( );
         int nrows = this->model->getNRows( );
         const auto& varNames = this->model->getVariableNames( );
         const auto& consNames = this->model->getConstraintNames( );
         const auto& domains = this->model->getVariableDomains( );
         const auto& obj = this->model->getObjective( );
         const auto& consMatrix = this->model->getConstraintMatrix( );
         const auto& lhs_values = consMatrix.getLeftHandSides( );
         const auto& rhs_values = consMatrix.getRightHandSides( );
         const auto& cflags = this->model->getColFlags( );
         const auto& rflags = this->model->getRowFlags( );

         set_parameters( );
         SCIP_CALL_ABORT(SCIPcreateProbBasic(scip, this->model->getName( ).c_str()));
         SCIP_CALL_ABORT(SCIPaddOrigObjoffset(scip, SCIP_Real(obj.offset)));
         SCIP_CALL_ABORT(SCIPsetObjsense(scip, obj.sense ? SCIP_OBJSENSE_MINIMIZE : SCIP_OBJSENSE_MAXIMIZE));
         vars.resize(ncols);

         for( int col = 0; col < ncols; ++col )
         {
            SCIP_VAR* var;
            SCIP_VARTYPE type;
            SCIP_Real lb = cflags[col].test(ColFlag::kLbInf)
                           ? -SCIPinfinity(scip)
                           : SCIP_Real(domains.lower_bounds[col]);
            SCIP_Real ub = cflags[col].test(ColFlag::kUbInf)
                           ? SCIPinfinity(scip)
                           : SCIP_Real(domains.upper_bounds[col]);
            if( cflags[col].test(ColFlag::kIntegral) )
            {
               if( lb >= 0 && ub <= 1 )
                  type = SCIP_VARTYPE_BINARY;
               else
                  type = SCIP_VARTYPE_INTEGER;
            }
            else
               type = SCIP_VARTYPE_CONTINUOUS;
            SCIP_CALL_ABORT(SCIPcreateVarBasic(scip, &var, varNames[col].c_str(), lb, ub,
                  SCIP_Real(obj.coefficients[col]), type));
            vars[col] = var;
            SCIP_CALL_ABORT(SCIPaddVar(scip, var));
            SCIP_CALL_ABORT(SCIPreleaseVar(scip, &var));
         }

         Vec<SCIP_VAR*> consvars(ncols);
         Vec<SCIP_Real> consvals(ncols);
         for( int row = 0; row < nrows; ++row )
         {
            assert(!rflags[row].test(RowFlag::kLhsInf) || !rflags[row].test(RowFlag::kRhsInf));
            const auto& rowvec = consMatrix.getRowCoefficients(row);
            const auto& rowinds = rowvec.getIndices( );
            const auto& rowvals = rowvec.getValues( );
            int nrowcols = rowvec.getLength( );
            SCIP_CONS* cons;
            SCIP_Real lhs = rflags[row].test(RowFlag::kLhsInf)
                            ? -SCIPinfinity(scip)
                            : SCIP_Real(lhs_values[row]);
            SCIP_Real rhs = rflags[row].test(RowFlag::kRhsInf)
                            ? SCIPinfinity(scip)
                            : SCIP_Real(rhs_values[row]);
            for( int i = 0; i < nrowcols; ++i )
            {
               assert(rowvals[i] != 0);
               consvars[i] = vars[rowinds[i]];
               consvals[i] = SCIP_Real(rowvals[i]);
            }
            SCIP_CALL_ABORT(SCIPcreateConsBasicLinear(scip, &cons, consNames[row].c_str(), nrowcols,
                  consvars.data( ), consvals.data( ), lhs, rhs));
            SCIP_CALL_ABORT(SCIPaddCons(scip, cons));
            SCIP_CALL_ABORT(SCIPreleaseCons(scip, &cons));
         }
      }

      std::pair<char, SolverStatus>
      solve( ) override
      {
         char retcode = SCIP_ERROR;
         SolverStatus solverstatus = SolverStatus::kUndefinedError;

         if( this->msg.getVerbosityLevel() < VerbosityLevel::kDetailed )
            SCIPsetMessagehdlrQuiet(scip, TRUE);
         else
            SCIPsetIntParam(scip, ScipParameters::VERB, 5);

         retcode = SCIPsolve(scip);

         if( retcode == SCIP_OKAY )
         {
            // reset return code
            retcode = SolverRetcode::OKAY;
            solverstatus = translateStatus(SCIPgetStatus(scip));

            SCIP_SOL* sol = SCIPgetBestSol(scip);
            if( sol != nullptr )
            {
               translateSolution(sol, this->solution);
               this->value = REAL(SCIPgetSolOrigObj(scip, sol));
               retcode = this->check_primal_solution( this->solution, REAL(SCIPfeastol(scip)) );
               if( retcode == SolverRetcode::OKAY )
                  retcode = this->check_objective_value( this->solution, this->value, REAL(SCIPfeastol(scip)) );
            }
            else
               this->solution = Solution<REAL>( isInfeasible(solverstatus) ? SolutionStatus::kInfeasible : SolutionStatus::kUnknown );
         }
         else
         {
            // shift retcodes so that all errors have negative values
            --retcode;
         }

         return { retcode, solverstatus };
      }

      bool
      writeInstance(const String& filename) const override
      {
         return SCIPwriteOrigProblem(scip, (filename + ".cip").c_str(), NULL, FALSE) == SCIP_OKAY;
      }

      ~ScipInterface( ) override
      {
         if( scip != nullptr && SCIPfree(&scip) != SCIP_OKAY )
            this->msg.warn("could not free SCIP\n");
      }

   private:

      void
      set_parameters( ) const
      {
         if( parameters.timelimit >= 0.0 )
            SCIP_CALL_ABORT(SCIPsetRealParam(scip, ScipParameters::TIME, parameters.timelimit));
         SCIP_CALL_ABORT(SCIPsetRealParam(scip, ScipParameters::GAP, parameters.gaplimit));
      }

      void
      translateSolution(SCIP_SOL* const sol, Solution<REAL>& result) const
      {
         result.status = SolutionStatus::kFeasible;
         result.primal.resize(this->model->getNCols());
         for( int col = 0; col < static_cast<int>(result.primal.size()); ++col )
            result.primal[col] = REAL(SCIPgetSolVal(scip, sol, vars[col]));
      }

      static SolverStatus
      translateStatus(SCIP_STATUS status)
      {
         switch( status )
         {
         case SCIP_STATUS_UNKNOWN:
            return SolverStatus::kUnknown;
         case SCIP_STATUS_USERINTERRUPT:
#if SCIP_APIVERSION >= 22
         case SCIP_STATUS_TERMINATE:
#endif
            return SolverStatus::kInterrupt;
         case SCIP_STATUS_NODELIMIT:
         case SCIP_STATUS_TOTALNODELIMIT:
         case SCIP_STATUS_STALLNODELIMIT:
         case SCIP_STATUS_RESTARTLIMIT:
            return SolverStatus::kNodeLimit;
         case SCIP_STATUS_TIMELIMIT:
            return SolverStatus::kTimeLimit;
         case SCIP_STATUS_MEMLIMIT:
            return SolverStatus::kMemLimit;
         case SCIP_STATUS_GAPLIMIT:
            return SolverStatus::kGapLimit;
#if SCIP_APIVERSION >= 115
         case SCIP_STATUS_PRIMALLIMIT:
         case SCIP_STATUS_DUALLIMIT:
#endif
         case SCIP_STATUS_SOLLIMIT:
         case SCIP_STATUS_BESTSOLLIMIT:
            return SolverStatus::kSolLimit;
         case SCIP_STATUS_OPTIMAL:
            return SolverStatus::kOptimal;
         case SCIP_STATUS_INFEASIBLE:
            return SolverStatus::kInfeasible;
         case SCIP_STATUS_UNBOUNDED:
            return SolverStatus::kUnbounded;
         case SCIP_STATUS_INFORUNBD:
            return SolverStatus::kInfeasibleOrUnbounded;
         default:
            return SolverStatus::kUnknown;
         }
      }
   };

   template <typename REAL>
   class ScipFactory : public SolverFactory<REAL>
   {
   private:

      ScipParameters parameters { };

   public:

      void
      addParameters(ParameterSet& parameterset) override
      {
         parameterset.addParameter("scip.timelimit", "time limit of a single solve in seconds or -1 for no limit", parameters.timelimit, -1.0);
         parameterset.addParameter("scip.gaplimit", "relative gap at which a solve stops", parameters.gaplimit, 0.0, 1.0);
      }

      std::unique_ptr<SolverInterface<REAL>>
      create_solver(const Message& msg) override
      {
         return std::unique_ptr<SolverInterface<REAL>>( new ScipInterface<REAL>( msg, parameters ) );
      }
   };

   template <typename REAL>
   std::shared_ptr<SolverFactory<REAL>>
   load_solver_factory( )
   {
      return std::shared_ptr<SolverFactory<REAL>>( new ScipFactory<REAL>( ) );
   }

} // namespace bandclass

#endif
