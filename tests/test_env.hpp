#pragma once

// Tests set XYLO_* variables with _putenv("NAME=VALUE"); "NAME=" unsets.
// POSIX builds get a local definition in test_env.cpp.
#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif
