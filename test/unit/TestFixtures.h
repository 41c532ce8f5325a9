//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shared helpers for unit tests: on-disk fixtures, JSON literals and parsing.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_TEST_UNIT_TEST_FIXTURES_H
#define FABLS_TEST_UNIT_TEST_FIXTURES_H

#include "fabls/Frontend/Parser.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

namespace fabls::test
{

/// @brief Unique temporary directory removed on destruction.
class ScopedTempDir final
{
public:
    explicit ScopedTempDir(const std::string& tag)
    {
        static std::atomic<unsigned> counter{0};
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        path_          = std::filesystem::temp_directory_path() /
                ("fabls-" + tag + "-" + std::to_string(now) + "-" + std::to_string(counter++));
        std::error_code ec;
        std::filesystem::create_directories(path_, ec);
    }

    ~ScopedTempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&)            = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const
    {
        return path_;
    }

    /// @brief Returns `path() / relative` as a string.
    [[nodiscard]] std::string file(const std::string& relative) const
    {
        return (path_ / relative).string();
    }

private:
    std::filesystem::path path_;
};

/// @brief Writes `text` to `path`, creating parent directories.
inline bool writeTextFile(const std::filesystem::path& path, const std::string& text)
{
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::binary);
    if (!out.good())
    {
        return false;
    }
    out << text;
    return out.good();
}

inline llvm::json::Value parseJson(const std::string& text)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(text);
    if (!parsed)
    {
        std::cerr << "invalid JSON test fixture: " << llvm::toString(parsed.takeError()) << "\n";
        std::abort();
    }
    return std::move(*parsed);
}

/// @brief Parses `text`, printing the error and returning `nullptr` on failure.
inline SyntaxTreeRef parseOrReport(const std::string& text, const std::string& filePath = "test.fab")
{
    llvm::Expected<SyntaxTreeRef> tree = parseFabSource(filePath, text);
    if (!tree)
    {
        std::cerr << "unexpected parse failure: " << llvm::toString(tree.takeError()) << "\n";
        return nullptr;
    }
    return std::move(*tree);
}

}  // namespace fabls::test

#endif  // FABLS_TEST_UNIT_TEST_FIXTURES_H
