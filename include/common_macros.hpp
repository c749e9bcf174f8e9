#pragma once

#include <iostream>

// ---------------------------------------------
// Define the macro to print messages conditionally
#ifdef DEBUG_BUILD
#define DEBUG_PRINT(...)                                                     \
  do {                                                                       \
    std::cerr << __VA_ARGS__ << std::endl;                                   \
  } while (0)
#else
#define DEBUG_PRINT(...) // No operation
#endif

// -------------------------------------------------

#ifndef UPDATECTRL_VERSION
#define UPDATECTRL_VERSION "0.1.0"
#endif
