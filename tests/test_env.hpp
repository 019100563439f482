#pragma once

// Env tests toggle LMM_* variables with _putenv("NAME=VALUE"); an empty value
// unsets the variable. POSIX builds get the definition from test_env.cpp.
#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif
