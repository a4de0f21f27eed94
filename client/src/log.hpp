#pragma once

// Logging control: define URLSTREAM_ENABLE_LOG to enable diagnostic logs.
// Warnings and errors are always written to std::cerr.
#ifdef URLSTREAM_ENABLE_LOG
#include <iostream>
#define URLSTREAM_LOG(stmt)                                                                        \
    do {                                                                                           \
        stmt;                                                                                      \
    } while (0)
#else
#define URLSTREAM_LOG(stmt)                                                                        \
    do {                                                                                           \
    } while (0)
#endif
