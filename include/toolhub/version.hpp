/*
 * Version macros for toolhub. The build defines TOOLHUB_VERSION_STRING from the project
 * version; the defaults below apply when compiling outside of it.
 */

#pragma once

#ifndef TOOLHUB_VERSION_MAJOR
#define TOOLHUB_VERSION_MAJOR 0
#endif

#ifndef TOOLHUB_VERSION_MINOR
#define TOOLHUB_VERSION_MINOR 1
#endif

#ifndef TOOLHUB_VERSION_PATCH
#define TOOLHUB_VERSION_PATCH 0
#endif

#ifndef TOOLHUB_VERSION_STRING
#define TOOLHUB_VERSION_STRING "0.1.0+dev"
#endif

namespace toolhub {
inline constexpr const char* kVersion = TOOLHUB_VERSION_STRING;
} // namespace toolhub
