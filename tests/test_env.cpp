// _putenv on top of setenv/unsetenv for non-Windows test builds.
#include "test_env.hpp"
#include <cstdlib>
#include <cstring>
#include <string>

#if !defined(_WIN32)
extern "C" int _putenv(const char* assignment)
{
    if (!assignment) return -1;
    const char* eq = std::strchr(assignment, '=');
    if (!eq) return -1;
    std::string name(assignment, static_cast<size_t>(eq - assignment));
    if (name.empty()) return -1;
    const char* value = eq + 1;
    if (!*value) return ::unsetenv(name.c_str());
    return ::setenv(name.c_str(), value, 1);
}
#endif
