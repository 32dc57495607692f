// CPU Benchmark - Debug logging

#include "debug_log.hpp"

#include <cstdlib>

bool enable_debug_env() {
#ifdef _WIN32
    return _putenv_s(DEBUG_ENV_VAR, "1") == 0;
#else
    return setenv(DEBUG_ENV_VAR, "1", 1) == 0;
#endif
}
