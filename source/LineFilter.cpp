// SPDX-License-Identifier: Apache-2.0
#include "LineFilter.hpp"
#include <istream>
#include <ostream>
#include <string>
#include "Utils.hpp"

bool LineFilter::shouldEmit(std::string_view line) {
    if (!line.starts_with(IMPORT_PREFIX)) {
        return true;
    }
    return line.find(KEPT_IMPORT) != std::string_view::npos;
}

FilterStats LineFilter::filterStream(std::istream& input, std::ostream& output) const {
    FilterStats stats;
    std::string line;
    while (readLine(input, line)) {
        stats.linesRead++;
        if (shouldEmit(line)) {
            output << line;
        } else {
            stats.linesDropped++;
        }
    }
    return stats;
}
