// SPDX-License-Identifier: Apache-2.0
#include "ImportFilter.hpp"
#include <iostream>
#include "Utils.hpp"

void ImportFilter::usage() {
    std::cerr << cmdLine.getHelpText(
        "import-filter: remove import declarations other than 'import Foundation'");
}

void ImportFilter::addArgs() {
    cmdLine.add("-h,--help", showHelp, "Display available options");

    cmdLine.setPositional(
        [this](std::string_view value) {
            addPath(value);
            return "";
        },
        "input-files ('-' for stdin, '--' ends options)");
}

void ImportFilter::parseCommandLine(std::string_view argList,
                                    CommandLine::ParseOptions parseOptions) {
    if (!cmdLine.parse(argList, parseOptions)) {
        for (auto& err : cmdLine.getErrors())
            std::cerr << err << std::endl;
        exit(1);
    }
}

void ImportFilter::parseCommandLine(int argc, char** argv) {
    // everything after "--" is an input file, even if it looks like an option
    int optionsEnd = argc;
    for (int i = 1; i < argc; i++) {
        if (std::string_view(argv[i]) == "--") {
            optionsEnd = i;
            break;
        }
    }
    if (!cmdLine.parse(optionsEnd, argv)) {
        for (auto& err : cmdLine.getErrors())
            std::cerr << err << std::endl;
        exit(1);
    }
    for (int i = optionsEnd + 1; i < argc; i++) {
        addPath(argv[i]);
    }
}

void ImportFilter::parseArgs(int argc, char** argv) {
    parseCommandLine(argc, argv);
    if (showHelp.value_or(false)) {
        usage();
        exit(0);
    }
}

FilterStats ImportFilter::run(std::ostream& output) {
    FilterStats total;
    inputs.resolve();
    inputs.forEach([&](std::istream& input, const InputSource& source) {
        auto stats = filter.filterStream(input, output);
        total.linesRead += stats.linesRead;
        total.linesDropped += stats.linesDropped;
        // output of consumed sources must survive failure on later ones
        output << std::flush;
        if (!output) {
            PRINTF_ERR("failed to write output of '%s'\n", source.getName().c_str());
            exit(1);
        }
    });
    return total;
}
