//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime configuration model for the NESFab language server.
///
/// Values start from the process environment and command line, and are then
/// updated from `initialize` options and `workspace/didChangeConfiguration`
/// notifications.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_SERVER_CONFIG_H
#define FABLS_LSP_SERVER_CONFIG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <optional>
#include <string>

namespace fabls::lsp
{

/// @brief Verbosity of `window/logMessage` output.
enum class TraceLevel
{
    /// @brief Errors only.
    Off,

    /// @brief Errors and info lines.
    Basic,

    /// @brief Everything, including per-file indexing lines.
    Verbose,
};

/// @brief Mutable runtime configuration for `fabd`.
struct ServerConfig final
{
    /// @brief NESFab installation directory used to resolve config inputs
    ///        that are not found next to the config file.
    std::string nesfabDirectory;

    TraceLevel traceLevel{TraceLevel::Basic};
};

/// @brief Parses a trace level name (`off`, `basic`, `verbose`).
[[nodiscard]] std::optional<TraceLevel> parseTraceLevel(llvm::StringRef name);

/// @brief Returns the canonical name of `level`.
[[nodiscard]] llvm::StringRef traceLevelName(TraceLevel level);

/// @brief Applies `initialize` request `initializationOptions`.
/// @param[in] options Value of the `initializationOptions` field.
/// @param[in,out] config Configuration instance to update.
/// @return `true` when `options` was an object.
bool applyInitializationOptions(const llvm::json::Value& options, ServerConfig& config);

/// @brief Applies settings from `workspace/didChangeConfiguration` params.
///
/// Reads `settings.fabls.nesfabPath` and `settings.fabls.trace`. A flat
/// `settings` object carrying the same keys is accepted as well.
/// @param[in] params Notification params object.
/// @param[in,out] config Configuration instance to update.
/// @return `true` when params had a parseable `settings` object.
[[nodiscard]] bool applyDidChangeConfiguration(const llvm::json::Value& params, ServerConfig& config);

}  // namespace fabls::lsp

#endif  // FABLS_LSP_SERVER_CONFIG_H
