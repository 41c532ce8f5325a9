//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the file update and workspace refresh protocols of the index.
///
//===----------------------------------------------------------------------===//

#include "fabls/LSP/ProjectIndex.h"

#include "fabls/LSP/SymbolExtractor.h"
#include "fabls/Support/FileSystem.h"

#include "llvm/Support/Parallel.h"

#include <algorithm>
#include <functional>

namespace fabls::lsp
{
namespace
{

struct BulkIndexJob final
{
    std::string filePath;
    std::string error;
    bool        published{false};
};

std::vector<std::string> normalizeAll(const std::vector<std::string>& paths)
{
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const std::string& path : paths)
    {
        if (!path.empty())
        {
            out.push_back(normalizePath(path));
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

bool isUnderAny(llvm::StringRef path, const std::vector<std::string>& directories)
{
    return std::any_of(directories.begin(), directories.end(), [path](const std::string& directory) {
        return isPathUnder(path, directory);
    });
}

}  // namespace

ProjectIndex::ProjectIndex(const SourceParser& parser, std::string fallbackDirectory)
    : parser_(parser)
    , fallbackDirectory_(std::move(fallbackDirectory))
{
}

std::mutex& ProjectIndex::updateLockFor(const std::string& key)
{
    return updateLocks_[std::hash<std::string>{}(key) % updateLocks_.size()];
}

llvm::Error ProjectIndex::updateFile(llvm::StringRef path, std::string text)
{
    const std::string           key = normalizePath(path);
    std::lock_guard<std::mutex> lock(updateLockFor(key));

    texts_.put(key, std::make_shared<const std::string>(text));

    llvm::Expected<SyntaxTreeRef> tree = parser_.parse(key, std::move(text));
    if (!tree)
    {
        return tree.takeError();
    }
    llvm::Expected<SymbolTable> table = extractSymbols(**tree, key);
    if (!table)
    {
        return table.takeError();
    }

    trees_.put(key, std::move(*tree));
    symbols_.put(key, std::make_shared<const SymbolTable>(std::move(*table)));
    return llvm::Error::success();
}

RefreshReport ProjectIndex::refreshWorkspace(const std::vector<std::string>& added,
                                             const std::vector<std::string>& removed)
{
    std::lock_guard<std::mutex> refreshLock(refreshMutex_);

    RefreshReport report;
    report.scannedRoots = normalizeAll(added);
    report.removedRoots = normalizeAll(removed);

    {
        std::unique_lock<std::shared_mutex> lock(rootsMutex_);
        for (const std::string& root : report.removedRoots)
        {
            roots_.erase(root);
        }
        roots_.insert(report.scannedRoots.begin(), report.scannedRoots.end());
    }

    if (!report.removedRoots.empty())
    {
        const std::vector<std::string> remaining = workspaceRoots();
        report.evictedConfigDirectories =
            dependencies_.eraseIf([&](const std::string& directory, const std::set<std::string>&) {
                return isUnderAny(directory, report.removedRoots) && !isUnderAny(directory, remaining);
            });
    }

    if (!report.scannedRoots.empty())
    {
        DependencyGraph graph = buildDependencyGraph(report.scannedRoots, fallbackDirectory());
        dependencies_.eraseIf([&](const std::string& directory, const std::set<std::string>&) {
            return isUnderAny(directory, report.scannedRoots) && !graph.contains(directory);
        });
        for (auto& [directory, files] : graph)
        {
            report.configDirectories.push_back(directory);
            dependencies_.put(directory, std::make_shared<const std::set<std::string>>(std::move(files)));
        }
    }

    std::set<std::string> pending;
    for (const auto& [directory, files] : dependencies_.snapshot())
    {
        for (const std::string& file : *files)
        {
            if (!symbols_.contains(file))
            {
                pending.insert(file);
            }
        }
    }

    std::vector<BulkIndexJob> jobs;
    jobs.reserve(pending.size());
    for (const std::string& file : pending)
    {
        jobs.push_back(BulkIndexJob{file, {}, false});
    }

    llvm::parallelForEach(jobs.begin(), jobs.end(), [this](BulkIndexJob& job) {
        llvm::Expected<std::string> text = readTextFile(job.filePath);
        if (!text)
        {
            job.error = llvm::toString(text.takeError());
            return;
        }
        llvm::Expected<SyntaxTreeRef> tree = parser_.parse(job.filePath, std::move(*text));
        if (!tree)
        {
            job.error = llvm::toString(tree.takeError());
            return;
        }
        llvm::Expected<SymbolTable> table = extractSymbols(**tree, job.filePath);
        if (!table)
        {
            job.error = llvm::toString(table.takeError());
            return;
        }
        job.published =
            symbols_.insertIfAbsent(job.filePath, std::make_shared<const SymbolTable>(std::move(*table)));
    });

    for (BulkIndexJob& job : jobs)
    {
        if (!job.error.empty())
        {
            report.failures.push_back(IndexFailure{job.filePath, std::move(job.error)});
        }
        else if (job.published)
        {
            report.indexedFiles.push_back(job.filePath);
        }
    }
    return report;
}

void ProjectIndex::addWorkspaceRoots(const std::vector<std::string>& roots)
{
    const std::vector<std::string>      normalized = normalizeAll(roots);
    std::unique_lock<std::shared_mutex> lock(rootsMutex_);
    roots_.insert(normalized.begin(), normalized.end());
}

std::vector<std::string> ProjectIndex::workspaceRoots() const
{
    std::shared_lock<std::shared_mutex> lock(rootsMutex_);
    return {roots_.begin(), roots_.end()};
}

std::shared_ptr<const std::string> ProjectIndex::lookupText(llvm::StringRef path) const
{
    return texts_.get(normalizePath(path));
}

SyntaxTreeRef ProjectIndex::lookupTree(llvm::StringRef path) const
{
    return trees_.get(normalizePath(path));
}

std::shared_ptr<const SymbolTable> ProjectIndex::lookupSymbols(llvm::StringRef path) const
{
    return symbols_.get(normalizePath(path));
}

DependencyGraph ProjectIndex::dependencyGraph() const
{
    DependencyGraph graph;
    for (const auto& [directory, files] : dependencies_.snapshot())
    {
        graph.emplace(directory, *files);
    }
    return graph;
}

std::vector<std::pair<std::string, std::shared_ptr<const SymbolTable>>> ProjectIndex::symbolTables() const
{
    auto tables = symbols_.snapshot();
    std::sort(tables.begin(), tables.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    return tables;
}

void ProjectIndex::setFallbackDirectory(std::string directory)
{
    std::lock_guard<std::mutex> lock(fallbackMutex_);
    fallbackDirectory_ = std::move(directory);
}

std::string ProjectIndex::fallbackDirectory() const
{
    std::lock_guard<std::mutex> lock(fallbackMutex_);
    return fallbackDirectory_;
}

}  // namespace fabls::lsp
