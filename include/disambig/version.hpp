/*
 * Version macros for disambig.
 *
 * The build passes DISAMBIG_VERSION_* definitions from project(); the fallbacks below keep
 * the header usable when it is included outside that build.
 */

#pragma once

#ifndef DISAMBIG_VERSION_MAJOR
#define DISAMBIG_VERSION_MAJOR 0
#endif

#ifndef DISAMBIG_VERSION_MINOR
#define DISAMBIG_VERSION_MINOR 0
#endif

#ifndef DISAMBIG_VERSION_PATCH
#define DISAMBIG_VERSION_PATCH 0
#endif

#ifndef DISAMBIG_VERSION_STRING
#define DISAMBIG_VERSION_STRING "0.0.0+dev"
#endif
