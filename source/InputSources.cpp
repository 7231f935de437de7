// SPDX-License-Identifier: Apache-2.0
#include "InputSources.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include "Utils.hpp"

InputSources::InputSources() : stdinStream(&std::cin) {}

void InputSources::resolve() {
    if (sources.empty()) {
        sources.push_back(InputSource::standardInput());
    }
}

void InputSources::readFailed(const InputSource& source) const {
    PRINTF_ERR("failed to read '%s': %s\n", source.getName().c_str(),
               errno ? strerror(errno) : "unknown error");
    exit(1);
}

void InputSources::readFile(const InputSource& source, const Callback& callback) const {
    std::error_code ec;
    if (fs::is_directory(source.getPath(), ec)) {
        PRINTF_ERR("failed to open '%s': %s\n", source.getName().c_str(), strerror(EISDIR));
        exit(1);
    }
    errno = 0;
    std::ifstream input(source.getPath(), std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        PRINTF_ERR("failed to open '%s': %s\n", source.getName().c_str(),
                   errno ? strerror(errno) : "unknown error");
        exit(1);
    }
    errno = 0;
    callback(input, source);
    if (input.bad()) {
        readFailed(source);
    }
}

void InputSources::forEach(const Callback& callback) const {
    ASSERT(!sources.empty(), "input sources used before resolve()");
    for (auto& source : sources) {
        if (source.isStandardInput()) {
            // stdin may be listed more than once, later reads just see EOF
            stdinStream->clear(stdinStream->rdstate() & std::ios::badbit);
            errno = 0;
            callback(*stdinStream, source);
            if (stdinStream->bad()) {
                readFailed(source);
            }
        } else {
            readFile(source, callback);
        }
    }
}
