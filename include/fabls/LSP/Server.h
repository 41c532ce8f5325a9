//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language server session coordinator for request/notification handling.
///
/// This layer wires JSON-RPC protocol messages to the project index, the
/// symbol resolver, background workspace refreshes, configuration state and
/// telemetry. Messages are handled one at a time on the caller's thread;
/// workspace refreshes run on the server's @ref WorkQueue.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_SERVER_H
#define FABLS_LSP_SERVER_H

#include "fabls/Frontend/Parser.h"
#include "fabls/LSP/ProjectIndex.h"
#include "fabls/LSP/ServerConfig.h"
#include "fabls/LSP/SymbolResolver.h"
#include "fabls/LSP/Telemetry.h"
#include "fabls/LSP/WorkQueue.h"

#include "llvm/Support/JSON.h"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace fabls::lsp
{

/// @brief `window/logMessage` message types.
enum class MessageType
{
    Error   = 1,
    Warning = 2,
    Info    = 3,
    Log     = 4,
};

/// @brief LSP server core for message dispatch and state management.
class Server final
{
public:
    /// @brief Outbound transport callback for JSON-RPC responses/notifications.
    ///
    /// Called from the message thread and from the background worker.
    using SendMessageFn = std::function<void(llvm::json::Value message)>;

    /// @brief Constructs the server.
    /// @param[in] sendMessage Outbound message sink.
    /// @param[in] config Initial configuration (environment and command line).
    /// @param[in] metricSink Optional telemetry sample sink.
    explicit Server(SendMessageFn sendMessage, ServerConfig config = {}, RequestMetricSink metricSink = {});
    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    /// @brief Handles one incoming JSON-RPC message.
    void handleMessage(const llvm::json::Value& message);

    /// @brief Returns whether an `exit` notification was observed.
    [[nodiscard]] bool shouldExit() const
    {
        return shouldExit_;
    }

    /// @brief Returns the LSP-conformant process exit code.
    /// @return `0` after orderly `shutdown`+`exit`, otherwise non-zero.
    [[nodiscard]] int exitCode() const
    {
        return exitCode_;
    }

    [[nodiscard]] bool shutdownRequested() const
    {
        return shutdownRequested_;
    }

    [[nodiscard]] const ServerConfig& config() const
    {
        return config_;
    }

    [[nodiscard]] const ProjectIndex& index() const
    {
        return index_;
    }

    [[nodiscard]] const Telemetry& telemetry() const
    {
        return telemetry_;
    }

    /// @brief Blocks until every posted workspace refresh has finished.
    void waitForBackgroundWork();

    /// @brief Drains and stops the background worker.
    void shutdown();

private:
    /// @return Whether the request produced a non-null result.
    bool handleRequest(const llvm::json::Object& message, llvm::StringRef method, const llvm::json::Value& id);
    void handleNotification(const llvm::json::Object& message, llvm::StringRef method);

    [[nodiscard]] llvm::json::Value handleInitialize(const llvm::json::Value* params);
    [[nodiscard]] llvm::json::Value handleHover(const llvm::json::Value* params) const;
    [[nodiscard]] llvm::json::Value handleDefinition(const llvm::json::Value* params) const;
    [[nodiscard]] llvm::json::Value handleCompletion(const llvm::json::Value* params) const;

    void updateDocument(const std::string& uri, std::string text);
    void postWorkspaceRefresh(std::vector<std::string> added, std::vector<std::string> removed);

    void sendResult(const llvm::json::Value& id, llvm::json::Value result);
    void sendError(const llvm::json::Value& id, int code, std::string message);
    void sendNotification(std::string method, llvm::json::Value params);
    void logMessage(MessageType type, const std::string& text);

    void applyConfig();

    SendMessageFn           sendMessage_;
    ServerConfig            config_;
    std::atomic<TraceLevel> traceLevel_;
    FabParser               parser_;
    ProjectIndex            index_;
    SymbolResolver          resolver_;
    Telemetry               telemetry_;
    WorkQueue               workQueue_;
    bool                    initialized_{false};
    bool                    shutdownRequested_{false};
    bool                    shouldExit_{false};
    int                     exitCode_{0};
};

}  // namespace fabls::lsp

#endif  // FABLS_LSP_SERVER_H
