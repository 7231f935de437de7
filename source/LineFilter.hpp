// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <cstddef>
#include <iosfwd>
#include <string_view>

// Lines starting with this prefix are treated as import declarations
inline constexpr std::string_view IMPORT_PREFIX = "import";
// Import declarations containing this are kept, all others are removed
inline constexpr std::string_view KEPT_IMPORT = "import Foundation";

struct FilterStats {
    size_t linesRead = 0;
    size_t linesDropped = 0;
};

class LineFilter {
   public:
    // Keep/drop decision for a single line (terminator included or not, it does not matter).
    // Prefix test is done on the raw line, so indented imports are always kept.
    static bool shouldEmit(std::string_view line);

    // Copy every line of input that passes shouldEmit() to output, byte-for-byte
    FilterStats filterStream(std::istream& input, std::ostream& output) const;
};
