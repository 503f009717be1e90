/*
 * Version macros for ankidirect.
 *
 * The build system defines these on the command line; the fallbacks keep the
 * headers usable when the library is consumed without CMake.
 */

#pragma once

#ifndef ANKIDIRECT_VERSION_MAJOR
#define ANKIDIRECT_VERSION_MAJOR 0
#endif

#ifndef ANKIDIRECT_VERSION_MINOR
#define ANKIDIRECT_VERSION_MINOR 1
#endif

#ifndef ANKIDIRECT_VERSION_PATCH
#define ANKIDIRECT_VERSION_PATCH 0
#endif

#ifndef ANKIDIRECT_VERSION_STRING
#define ANKIDIRECT_VERSION_STRING "0.1.0+dev"
#endif

// User-Agent sent with every HTTP request
#define ANKIDIRECT_USER_AGENT "ankidirect/" ANKIDIRECT_VERSION_STRING
