#pragma once

// Windows-only includes. Pulls in <windows.h> and removes the macros it defines
// that collide with BehaviorKind, LogLevel and Severity enumerators.

#ifdef _WIN32

#ifndef NOMINMAX
#define NOMINMAX
#endif

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif

#include <windows.h>

#ifdef FILE_CREATE
#undef FILE_CREATE
#endif

#ifdef PROCESS_CREATE
#undef PROCESS_CREATE
#endif

#ifdef IMAGE_LOAD
#undef IMAGE_LOAD
#endif

#ifdef DNS_QUERY
#undef DNS_QUERY
#endif

#ifdef ERROR
#undef ERROR
#endif

#ifdef CRITICAL
#undef CRITICAL
#endif

#ifdef OTHER
#undef OTHER
#endif

#endif // _WIN32
