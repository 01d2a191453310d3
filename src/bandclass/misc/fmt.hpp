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

#ifndef _BANDCLASS_MISC_FMT_HPP_
#define _BANDCLASS_MISC_FMT_HPP_

/* if those macros are not defined and fmt includes windows.h
 * then many macros are defined that can interfere with standard C++ code
 */
#ifndef NOMINMAX
#define NOMINMAX
#define BANDCLASS_DEFINED_NOMINMAX
#endif

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#define BANDCLASS_DEFINED_WIN32_LEAN_AND_MEAN
#endif

#ifndef NOGDI
#define NOGDI
#define BANDCLASS_DEFINED_NOGDI
#endif

#include <fmt/format.h>
#include <fmt/ostream.h>

#ifdef BANDCLASS_DEFINED_NOGDI
#undef NOGDI
#undef BANDCLASS_DEFINED_NOGDI
#endif

#ifdef BANDCLASS_DEFINED_NOMINMAX
#undef NOMINMAX
#undef BANDCLASS_DEFINED_NOMINMAX
#endif

#ifdef BANDCLASS_DEFINED_WIN32_LEAN_AND_MEAN
#undef WIN32_LEAN_AND_MEAN
#undef BANDCLASS_DEFINED_WIN32_LEAN_AND_MEAN
#endif

/* since fmt 9 types are no longer formatted through operator<< implicitly,
 * this declares the formatter for a type that only provides the stream operator
 */
#if FMT_VERSION >= 90000
#define BANDCLASS_OSTREAM_FORMATTER( Type )                                   \
   template <>                                                               \
   struct fmt::formatter<Type> : fmt::ostream_formatter                       \
   {                                                                         \
   };
#else
#define BANDCLASS_OSTREAM_FORMATTER( Type )
#endif

#endif
