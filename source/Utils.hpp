// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <cstdio>
#include <cstdlib>
#include <istream>
#include <string>

// Read next line from input, keeping its terminator (if any) in `line`.
// Returns false when there is nothing left to read.
bool readLine(std::istream& input, std::string& line);

// NOTE: doing it as variadic func rather than macro would prevent
// compiler from issuing warnings about incorrect format string
#define PRINTF_ERR(...) \
    do { \
        fprintf(stderr, "import-filter: "); \
        fprintf(stderr, __VA_ARGS__); \
    } while (0)

#define PRINTF_INTERNAL_ERR(...) \
    do { \
        PRINTF_ERR("Internal error: %s:%d: ", __FILE__, __LINE__); \
        fprintf(stderr, __VA_ARGS__); \
    } while (0)

#define ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            PRINTF_INTERNAL_ERR("Assertion `%s` failed: %s\n", #cond, msg); \
            exit(1); \
        } \
    } while (0)
