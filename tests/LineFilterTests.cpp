// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "LineFilter.hpp"

namespace {

std::string filter(const std::string& text, FilterStats* stats = nullptr) {
    std::istringstream input(text);
    std::ostringstream output;
    auto result = LineFilter().filterStream(input, output);
    if (stats)
        *stats = result;
    return output.str();
}

}  // namespace

TEST(LineFilterTest, KeepsFoundationImport) {
    EXPECT_TRUE(LineFilter::shouldEmit("import Foundation\n"));
    EXPECT_EQ(filter("import Foundation\n"), "import Foundation\n");
}

TEST(LineFilterTest, DropsOtherImports) {
    EXPECT_FALSE(LineFilter::shouldEmit("import UIKit\n"));
    EXPECT_FALSE(LineFilter::shouldEmit("import Kitura"));
    EXPECT_FALSE(LineFilter::shouldEmit("import"));
    EXPECT_EQ(filter("import UIKit\n"), "");
}

TEST(LineFilterTest, PrefixHasNoWordBoundary) {
    EXPECT_FALSE(LineFilter::shouldEmit("importFoo\n"));
    EXPECT_FALSE(LineFilter::shouldEmit("imports are here\n"));
}

TEST(LineFilterTest, PrefixIsCaseSensitive) {
    EXPECT_TRUE(LineFilter::shouldEmit("Import UIKit\n"));
    EXPECT_TRUE(LineFilter::shouldEmit("IMPORT UIKit\n"));
}

TEST(LineFilterTest, KeptImportIsSubstringMatch) {
    EXPECT_TRUE(LineFilter::shouldEmit("import FooFoundation, import Foundation\n"));
    EXPECT_TRUE(LineFilter::shouldEmit("import struct Foo // import Foundation\n"));
    EXPECT_TRUE(LineFilter::shouldEmit("import FoundationNetworking\n"));
    EXPECT_FALSE(LineFilter::shouldEmit("import  Foundation\n"));
    EXPECT_FALSE(LineFilter::shouldEmit("import FooFoundation\n"));
}

TEST(LineFilterTest, PassesNonImportLines) {
    EXPECT_TRUE(LineFilter::shouldEmit("let x = 5\n"));
    EXPECT_TRUE(LineFilter::shouldEmit("// import UIKit\n"));
    EXPECT_TRUE(LineFilter::shouldEmit(""));
    EXPECT_TRUE(LineFilter::shouldEmit("\n"));
    EXPECT_TRUE(LineFilter::shouldEmit("   \t\n"));
    EXPECT_EQ(filter("let x = 5\n"), "let x = 5\n");
}

TEST(LineFilterTest, IndentedImportIsPassedThrough) {
    EXPECT_TRUE(LineFilter::shouldEmit("  import UIKit\n"));
    EXPECT_TRUE(LineFilter::shouldEmit("\timport UIKit\n"));
    EXPECT_EQ(filter("  import UIKit\n"), "  import UIKit\n");
}

TEST(LineFilterTest, MixedInput) {
    FilterStats stats;
    EXPECT_EQ(filter("import Foundation\nimport UIKit\nlet x = 5\n", &stats),
              "import Foundation\nlet x = 5\n");
    EXPECT_EQ(stats.linesRead, 3u);
    EXPECT_EQ(stats.linesDropped, 1u);
}

TEST(LineFilterTest, EmptyInput) {
    FilterStats stats;
    EXPECT_EQ(filter("", &stats), "");
    EXPECT_EQ(stats.linesRead, 0u);
    EXPECT_EQ(stats.linesDropped, 0u);
}

TEST(LineFilterTest, KeepsBlankLinesAndOrder) {
    const std::string input =
        "import Kitura\n"
        "\n"
        "import Foundation\n"
        "import KituraContracts\n"
        "\n"
        "public class Client {\n"
        "    import LoggerAPI\n"
        "}\n";
    const std::string expected =
        "\n"
        "import Foundation\n"
        "\n"
        "public class Client {\n"
        "    import LoggerAPI\n"
        "}\n";
    EXPECT_EQ(filter(input), expected);
}

TEST(LineFilterTest, PreservesTerminators) {
    EXPECT_EQ(filter("let x = 5"), "let x = 5");
    EXPECT_EQ(filter("a\nlet x = 5"), "a\nlet x = 5");
    EXPECT_EQ(filter("import UIKit"), "");
    EXPECT_EQ(filter("a\r\nimport UIKit\r\nimport Foundation\r\n"),
              "a\r\nimport Foundation\r\n");
    EXPECT_EQ(filter("\n\n\n"), "\n\n\n");
}

TEST(LineFilterTest, Idempotent) {
    const std::string input =
        "import Foundation\nimport UIKit\n  import Dispatch\nimportX\nlet x = 5\nlast";
    auto once = filter(input);
    EXPECT_EQ(filter(once), once);
}
