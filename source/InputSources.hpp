// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// single input: either a named file or standard input
class InputSource {
   public:
    // argument that selects standard input instead of a file
    static constexpr std::string_view STDIN_MARKER = "-";

    explicit InputSource(fs::path path) : path(std::move(path)) {}
    static InputSource standardInput() { return InputSource(fs::path(STDIN_MARKER)); }

    bool isStandardInput() const { return path == fs::path(STDIN_MARKER); }
    const fs::path& getPath() const { return path; }
    std::string getName() const { return isStandardInput() ? "<stdin>" : path.string(); }

   private:
    fs::path path;
};

// Ordered list of inputs resolved once from command line.
// Sources are read one after another, as if they were concatenated.
class InputSources {
   public:
    using Callback = std::function<void(std::istream&, const InputSource&)>;

    InputSources();

    void add(std::string_view arg) { sources.emplace_back(fs::path(arg)); }
    // fall back to standard input when nothing was given
    void resolve();

    bool empty() const { return sources.empty(); }
    size_t size() const { return sources.size(); }
    const InputSource& operator[](size_t idx) const { return sources[idx]; }

    // replace std::cin, mainly for tests
    void setStandardInput(std::istream& stream) { stdinStream = &stream; }

    // Open sources in order and pass each to callback. Next source is opened only after
    // previous one was consumed. Failure to open or read a source is fatal.
    void forEach(const Callback& callback) const;

   private:
    void readFile(const InputSource& source, const Callback& callback) const;
    void readFailed(const InputSource& source) const;

    std::vector<InputSource> sources;
    std::istream* stdinStream;
};
