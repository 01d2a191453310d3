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

#ifndef __BANDCLASS_INTERFACES_SOLVERSTATUS_HPP__
#define __BANDCLASS_INTERFACES_SOLVERSTATUS_HPP__

#include "bandclass/misc/fmt.hpp"
#include <ostream>
#include <string>

namespace bandclass
{

template<typename EnumType, EnumType... Values>
class EnumCheck;

template<typename EnumType>
class EnumCheck<EnumType>
{
public:
   template<typename IntType>
   static bool constexpr is_value(IntType) { return false; }
};

template<typename EnumType, EnumType V, EnumType... Next>
class EnumCheck<EnumType, V, Next...> : private EnumCheck<EnumType, Next...>
{
   using super = EnumCheck<EnumType, Next...>;

public:
   template<typename IntType>
   static bool constexpr is_value(IntType v)
   {
      return v == static_cast<IntType>(V) || super::is_value(v);
   }
};

enum class SolverStatus : int {

   kUndefinedError = -1,

   kUnknown = 0,

   kOptimal = 1,

   kInfeasible = 2,

   kInfeasibleOrUnbounded = 3,

   kUnbounded = 4,

   kNodeLimit = 5,

   kTimeLimit = 6,

   kGapLimit = 7,

   kMemLimit = 8,

   kSolLimit = 9,

   kInterrupt = 10,

};

using SolverStatusCheck = EnumCheck< SolverStatus,
      SolverStatus::kUndefinedError,
      SolverStatus::kUnknown,
      SolverStatus::kOptimal,
      SolverStatus::kInfeasible,
      SolverStatus::kInfeasibleOrUnbounded,
      SolverStatus::kUnbounded,
      SolverStatus::kNodeLimit,
      SolverStatus::kTimeLimit,
      SolverStatus::kGapLimit,
      SolverStatus::kMemLimit,
      SolverStatus::kSolLimit,
      SolverStatus::kInterrupt
      >;

/// whether the status proves that no assignment exists; unboundedness is
/// impossible for assignment models, so an undecided infeasible-or-unbounded
/// status also counts
inline bool
isInfeasible(const SolverStatus status)
{
   return status == SolverStatus::kInfeasible || status == SolverStatus::kInfeasibleOrUnbounded;
}

/// whether the solve stopped at a limit before proving optimality
inline bool
isLimit(const SolverStatus status)
{
   switch( status )
   {
      case SolverStatus::kNodeLimit:
      case SolverStatus::kTimeLimit:
      case SolverStatus::kGapLimit:
      case SolverStatus::kMemLimit:
      case SolverStatus::kSolLimit:
      case SolverStatus::kInterrupt:
         return true;
      default:
         return false;
   }
}

inline std::ostream &operator<<(std::ostream &out, const SolverStatus status) {
   std::string val;
   switch( status )
   {
      case SolverStatus::kInfeasible:
         val = "infeasible";
         break;
      case SolverStatus::kInfeasibleOrUnbounded:
         val = "infeasible or unbounded";
         break;
      case SolverStatus::kOptimal:
         val = "optimal";
         break;
      case SolverStatus::kUnbounded:
         val = "unbounded";
         break;
      case SolverStatus::kNodeLimit:
         val = "nodelimit";
         break;
      case SolverStatus::kTimeLimit:
         val = "timelimit";
         break;
      case SolverStatus::kGapLimit:
         val = "gaplimit";
         break;
      case SolverStatus::kMemLimit:
         val = "memlimit";
         break;
      case SolverStatus::kSolLimit:
         val = "sollimit";
         break;
      case SolverStatus::kInterrupt:
         val = "interrupt";
         break;
      case SolverStatus::kUndefinedError:
         val = "ERROR";
         break;
      case SolverStatus::kUnknown:
         val = "unknown";
         break;
      default:
         val = "Error";
         break;
   }
   return out << val;
}

} // namespace bandclass

BANDCLASS_OSTREAM_FORMATTER( bandclass::SolverStatus )

#endif
