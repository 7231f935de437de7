// SPDX-License-Identifier: Apache-2.0
#include "Utils.hpp"
#include <string>

bool readLine(std::istream& input, std::string& line) {
    if (!std::getline(input, line)) {
        return false;
    }
    // getline sets eofbit only if it ran out of input before finding '\n',
    // which means the last line was unterminated
    if (!input.eof()) {
        line += '\n';
    }
    return true;
}
