#pragma once

#include <iostream>

// Compile with -DDEBUG=1 to trace the planner on stderr
#if DEBUG
    #define DBG(x) do { std::cerr << "[routeopt] " << x << std::endl; } while (0)
#else
    #define DBG(x) do {} while (0)
#endif
