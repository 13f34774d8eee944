// _putenv for POSIX, mapped onto setenv/unsetenv.
#include <cstdlib>
#include <cstring>
#include <string>

#if !defined(_WIN32)
extern "C" int _putenv(const char* assignment)
{
    if(!assignment) return -1;
    const char* eq = std::strchr(assignment, '=');
    if(!eq) return -1;
    std::string name(assignment, static_cast<size_t>(eq - assignment));
    if(!eq[1]) return ::unsetenv(name.c_str());
    return ::setenv(name.c_str(), eq + 1, 1);
}
#endif
