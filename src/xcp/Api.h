// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#ifndef xcp_api_hpp
#define xcp_api_hpp (1)

#include <xcp/defines.h>

// libxcp exports
#if defined(BUILD_XCP)
#define XCP_API XCP_EXPORT
#else
#define XCP_API XCP_IMPORT
#endif

#endif
