// SPDX-License-Identifier: Apache-2.0
#include <iostream>
#include "ImportFilter.hpp"

int main(int argc, char** argv) {
    ImportFilter importFilter = ImportFilter();
    importFilter.addArgs();

    importFilter.parseArgs(argc, argv);

    importFilter.run(std::cout);
}
