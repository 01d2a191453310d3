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

#ifndef _BANDCLASS_MISC_VERSION_LOGGER_HPP_
#define _BANDCLASS_MISC_VERSION_LOGGER_HPP_

#include "bandclass/misc/fmt.hpp"
#include <boost/version.hpp>
#include <typeinfo>

#ifndef BANDCLASS_VERSION_MAJOR
#define BANDCLASS_VERSION_MAJOR 1
#endif
#ifndef BANDCLASS_VERSION_MINOR
#define BANDCLASS_VERSION_MINOR 0
#endif
#ifndef BANDCLASS_VERSION_PATCH
#define BANDCLASS_VERSION_PATCH 0
#endif


namespace bandclass
{
template <typename REAL>
void
print_header()
{
   fmt::print( "BandClass version {}.{}.{} ", BANDCLASS_VERSION_MAJOR, BANDCLASS_VERSION_MINOR, BANDCLASS_VERSION_PATCH );

   fmt::print( "[arithmetic: {}]", typeid( REAL ).name() );

#if defined(__INTEL_COMPILER)
   fmt::print( "[Compiler: Intel {}]", __INTEL_COMPILER );
#elif defined(__clang__)
   fmt::print( "[Compiler: clang {}.{}.{}]", __clang_major__, __clang_minor__, __clang_patchlevel__ );
#elif defined(_MSC_VER)
   fmt::print( "[Compiler: microsoft visual c {}]", _MSC_FULL_VER );
#elif defined(__GNUC__)
   fmt::print( "[Compiler: gcc {}.{}.{}]", __GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__ );
#else
   fmt::print( "[Compiler: unknown]" );
#endif

#ifdef NDEBUG
   fmt::print( "[mode: optimized]" );
#else
   fmt::print( "[mode: debug]" );
#endif

#ifdef BANDCLASS_GITHASH_AVAILABLE
   fmt::print( "[GitHash: {}]", BANDCLASS_GITHASH );
#endif

   fmt::print( "\n" );
   fmt::print( "Copyright (C) 2024 The BandClass Authors\n" );
   fmt::print( "\n" );

   fmt::print( "External libraries: \n" );

   fmt::print( "  Boost    {}.{}.{} \t (https://www.boost.org/)\n", BOOST_VERSION / 100000,
               BOOST_VERSION / 100 % 1000, BOOST_VERSION % 100 );
   fmt::print( "  fmt      {}.{}.{} \t (https://fmt.dev/)\n", FMT_VERSION / 10000, FMT_VERSION / 100 % 100,
               FMT_VERSION % 100 );
   fmt::print( "\n" );
}

} // namespace bandclass

#endif
