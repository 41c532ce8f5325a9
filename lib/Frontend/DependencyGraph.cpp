//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements config file discovery and dependency graph construction.
///
/// Discovery walks each root recursively, then the config files are parsed
/// and resolved in parallel with each worker writing only its own slot.
///
//===----------------------------------------------------------------------===//

#include "fabls/Frontend/DependencyGraph.h"

#include "fabls/Support/FileSystem.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/Parallel.h"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fabls
{
namespace
{

struct ConfigScan
{
    std::string           configPath;
    std::string           directory;
    std::set<std::string> inputs;
    bool                  readable{false};
};

void findConfigFilesInRoot(const std::filesystem::path& root, std::vector<std::string>& out)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec))
    {
        return;
    }

    std::filesystem::recursive_directory_iterator it(root,
                                                     std::filesystem::directory_options::skip_permission_denied,
                                                     ec);
    const std::filesystem::recursive_directory_iterator end;
    while (!ec && it != end)
    {
        std::error_code typeError;
        if (it->is_regular_file(typeError) && it->path().extension() == ConfigFileExtension.str())
        {
            out.push_back(normalizePath(it->path().string()));
        }
        it.increment(ec);
    }
}

}  // namespace

std::vector<std::string> parseConfigInputs(llvm::StringRef text)
{
    std::vector<std::string>               inputs;
    llvm::SmallVector<llvm::StringRef, 64> lines;
    text.split(lines, '\n');
    for (llvm::StringRef line : lines)
    {
        line = line.rtrim('\r');
        llvm::SmallVector<llvm::StringRef, 3> parts;
        line.split(parts, '=');
        if (parts.size() != 2 || parts[0].trim() != "input")
        {
            continue;
        }
        const llvm::StringRef value = parts[1].trim();
        if (!value.empty())
        {
            inputs.push_back(value.str());
        }
    }
    return inputs;
}

std::vector<std::string> findConfigFiles(const std::vector<std::string>& roots)
{
    std::vector<std::string> configs;
    for (const std::string& root : roots)
    {
        findConfigFilesInRoot(root, configs);
    }
    std::sort(configs.begin(), configs.end());
    configs.erase(std::unique(configs.begin(), configs.end()), configs.end());
    return configs;
}

std::string resolveConfigInput(llvm::StringRef reference,
                               llvm::StringRef configDirectory,
                               llvm::StringRef fallbackDirectory)
{
    llvm::SmallVector<std::filesystem::path, 2> candidates;
    candidates.push_back(std::filesystem::path(configDirectory.str()) / reference.str());
    if (!fallbackDirectory.empty())
    {
        candidates.push_back(std::filesystem::path(fallbackDirectory.str()) / reference.str());
    }

    for (const std::filesystem::path& candidate : candidates)
    {
        std::error_code ec;
        auto            canonical = std::filesystem::canonical(candidate, ec);
        if (ec)
        {
            continue;
        }
        if (canonical.extension() != SourceFileExtension.str())
        {
            return {};
        }
        return canonical.string();
    }
    return {};
}

DependencyGraph buildDependencyGraph(const std::vector<std::string>& roots, llvm::StringRef fallbackDirectory)
{
    std::vector<ConfigScan> scans;
    for (std::string& configPath : findConfigFiles(roots))
    {
        ConfigScan scan;
        scan.directory  = std::filesystem::path(configPath).parent_path().string();
        scan.configPath = std::move(configPath);
        scans.push_back(std::move(scan));
    }

    const std::string fallback = fallbackDirectory.str();
    llvm::parallelForEach(scans.begin(), scans.end(), [&fallback](ConfigScan& scan) {
        auto text = readTextFile(scan.configPath);
        if (!text)
        {
            llvm::consumeError(text.takeError());
            return;
        }
        scan.readable = true;
        for (const std::string& reference : parseConfigInputs(*text))
        {
            std::string resolved = resolveConfigInput(reference, scan.directory, fallback);
            if (!resolved.empty())
            {
                scan.inputs.insert(std::move(resolved));
            }
        }
    });

    DependencyGraph graph;
    for (ConfigScan& scan : scans)
    {
        if (!scan.readable)
        {
            continue;
        }
        auto& inputs = graph[scan.directory];
        inputs.insert(scan.inputs.begin(), scan.inputs.end());
    }
    return graph;
}

}  // namespace fabls
