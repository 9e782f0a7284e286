// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#ifndef xcp_defines_hpp
#define xcp_defines_hpp (1)

#include <stddef.h>
#include <string.h>
#include <stdio.h>

// platforms
#if defined(_WIN32) || defined(__WIN32__)
#define XCP_OS_WIN32 1
#else
#define XCP_OS_UNIX 1
#if defined(__APPLE__)
#define XCP_OS_DARWIN 1 /* MacOS/X 10 */
#elif defined(__linux__)
#define XCP_OS_LINUX 1
#endif
#endif

// api decl tools
#if defined(__GNUC__)

#define XCP_NO_EXPORT __attribute__((visibility("hidden")))
#define XCP_EXPORT __attribute__((visibility("default")))
#define XCP_IMPORT /*!*/

#else

#define XCP_NO_EXPORT            /*!*/
#define XCP_EXPORT               /*!*/
#define XCP_IMPORT               /*!*/

#endif

#endif
