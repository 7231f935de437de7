// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <slang/util/CommandLine.h>
#include <iosfwd>
#include <optional>
#include <string_view>
#include "InputSources.hpp"
#include "LineFilter.hpp"

using namespace slang;

class ImportFilter {
   public:
    ImportFilter() = default;

    void addArgs();
    void usage();
    void parseCommandLine(std::string_view argList, CommandLine::ParseOptions parseOptions);
    void parseCommandLine(int argc, char** argv);
    void parseArgs(int argc, char** argv);

    void addPath(std::string_view path) { inputs.add(path); }
    InputSources& getInputs() { return inputs; }

    // filter all inputs into output, in order given on command line
    FilterStats run(std::ostream& output);

   private:
    CommandLine cmdLine;
    InputSources inputs;
    LineFilter filter;
    std::optional<bool> showHelp;
};
