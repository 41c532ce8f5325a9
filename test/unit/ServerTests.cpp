//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "TestFixtures.h"

#include "fabls/LSP/Server.h"
#include "fabls/LSP/Uri.h"
#include "fabls/Support/FileSystem.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace
{

using fabls::test::ScopedTempDir;
using fabls::test::writeTextFile;

/// Collects every message the server sends; the worker thread logs too.
class MessageRecorder final
{
public:
    fabls::lsp::Server::SendMessageFn sink()
    {
        return [this](llvm::json::Value message) {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(std::move(message));
        };
    }

    /// Returns a copy of the response carrying integer `id`.
    std::optional<llvm::json::Object> response(const std::int64_t id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const llvm::json::Value& message : messages_)
        {
            const auto* object = message.getAsObject();
            const auto* rawId  = object ? object->get("id") : nullptr;
            if (rawId && rawId->getAsInteger() == id)
            {
                return *object;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> logMessages() const
    {
        std::vector<std::string>    out;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const llvm::json::Value& message : messages_)
        {
            const auto* object = message.getAsObject();
            if (!object || object->getString("method") != llvm::StringRef("window/logMessage"))
            {
                continue;
            }
            if (const auto text = object->getObject("params")->getString("message"))
            {
                out.push_back(text->str());
            }
        }
        return out;
    }

    bool hasLog(llvm::StringRef text) const
    {
        const std::vector<std::string> logs = logMessages();
        return std::find(logs.begin(), logs.end(), text.str()) != logs.end();
    }

private:
    mutable std::mutex             mutex_;
    std::vector<llvm::json::Value> messages_;
};

std::optional<std::int64_t> errorCode(const std::optional<llvm::json::Object>& response)
{
    if (!response)
    {
        return std::nullopt;
    }
    const auto* error = response->getObject("error");
    if (!error)
    {
        return std::nullopt;
    }
    if (const auto code = error->getInteger("code"))
    {
        return *code;
    }
    return std::nullopt;
}

llvm::json::Value positionRequest(const std::int64_t id,
                                  llvm::StringRef    method,
                                  const std::string& uri,
                                  const int          line,
                                  const int          character)
{
    return llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params",
         llvm::json::Object{
             {"textDocument", llvm::json::Object{{"uri", uri}}},
             {"position", llvm::json::Object{{"line", line}, {"character", character}}},
         }},
    };
}

llvm::json::Value notification(llvm::StringRef method, llvm::json::Object params = {})
{
    return llvm::json::Object{{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}};
}

constexpr const char* MathText = "// Adds two numbers.\n"
                                 "fn add(U a, U b) U\n"
                                 "    return a + b\n"
                                 "\n"
                                 "U total = 0\n";

constexpr const char* MainText = "fn main()\n"
                                 "    U x = add(1, 2)\n"
                                 "    x = total\n";

bool testSessionFlow()
{
    ScopedTempDir workspace("server");
    if (!writeTextFile(workspace.path() / "game/math.fab", MathText) ||
        !writeTextFile(workspace.path() / "game/main.fab", MainText) ||
        !writeTextFile(workspace.path() / "game/game.cfg", "input = math.fab\ninput = main.fab\n"))
    {
        std::cerr << "failed to create server fixtures\n";
        return false;
    }
    const std::string rootUri  = fabls::lsp::pathToFileUri(fabls::normalizePath(workspace.path().string()));
    const std::string mainPath = fabls::normalizePath(workspace.file("game/main.fab"));
    const std::string mathPath = fabls::normalizePath(workspace.file("game/math.fab"));
    const std::string mainUri  = fabls::lsp::pathToFileUri(mainPath);

    MessageRecorder    recorder;
    fabls::lsp::Server server(recorder.sink());

    server.handleMessage(positionRequest(1, "textDocument/hover", mainUri, 1, 11));
    if (errorCode(recorder.response(1)) != -32002)
    {
        std::cerr << "requests before initialize should be rejected\n";
        return false;
    }

    server.handleMessage(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", 2},
        {"method", "initialize"},
        {"params",
         llvm::json::Object{
             {"workspaceFolders", llvm::json::Array{llvm::json::Object{{"uri", rootUri}, {"name", "game"}}}},
             {"initializationOptions", llvm::json::Object{{"trace", "verbose"}}},
         }},
    });
    const auto initialize = recorder.response(2);
    const auto* result     = initialize ? initialize->getObject("result") : nullptr;
    const auto* caps       = result ? result->getObject("capabilities") : nullptr;
    if (!caps || caps->getInteger("textDocumentSync") != std::int64_t{1} || caps->getBoolean("hoverProvider") != true ||
        !caps->getObject("completionProvider") ||
        result->getObject("serverInfo")->getString("name") != llvm::StringRef("fabd"))
    {
        std::cerr << "unexpected initialize result\n";
        return false;
    }
    if (server.config().traceLevel != fabls::lsp::TraceLevel::Verbose)
    {
        std::cerr << "initializationOptions should set the trace level\n";
        return false;
    }

    server.handleMessage(notification("initialized"));
    server.waitForBackgroundWork();
    if (!recorder.hasLog("workspace refreshed: 1 config directories, 2 files indexed, 0 failures") ||
        !recorder.hasLog("symbol cached: " + mathPath))
    {
        std::cerr << "initialized should index the workspace in the background\n";
        return false;
    }

    server.handleMessage(notification(
        "textDocument/didOpen",
        llvm::json::Object{{"textDocument",
                            llvm::json::Object{{"uri", mainUri}, {"languageId", "nesfab"}, {"version", 1}, {"text", MainText}}}}));
    if (!recorder.hasLog("did open") || !server.index().lookupTree(mainPath))
    {
        std::cerr << "didOpen should index the document\n";
        return false;
    }

    server.handleMessage(positionRequest(3, "textDocument/hover", mainUri, 1, 11));
    const auto  hover    = recorder.response(3);
    const auto* contents = hover && hover->getObject("result") ? hover->getObject("result")->getArray("contents") : nullptr;
    if (!contents || contents->size() != 2 || (*contents)[0].getAsString() != llvm::StringRef("game/math.fab") ||
        (*contents)[1].getAsObject()->getString("value") != llvm::StringRef("// Adds two numbers.\nfn add(U a, U b) U"))
    {
        std::cerr << "unexpected hover result\n";
        return false;
    }

    server.handleMessage(positionRequest(4, "textDocument/definition", mainUri, 1, 11));
    const auto  definition = recorder.response(4);
    const auto* location   = definition ? definition->getObject("result") : nullptr;
    if (!location || location->getString("uri") != llvm::StringRef(fabls::lsp::pathToFileUri(mathPath)) ||
        location->getObject("range")->getObject("start")->getInteger("line") != std::int64_t{1} ||
        location->getObject("range")->getObject("end")->getInteger("character") != std::int64_t{16})
    {
        std::cerr << "unexpected definition result\n";
        return false;
    }
    if (!recorder.hasLog("goto definition"))
    {
        std::cerr << "definition requests should be logged at verbose level\n";
        return false;
    }

    server.handleMessage(positionRequest(5, "textDocument/completion", mainUri, 2, 8));
    const auto  completion = recorder.response(5);
    const auto* items      = completion ? completion->getArray("result") : nullptr;
    if (!items || items->size() != 3)
    {
        std::cerr << "completion should list add, main and total\n";
        return false;
    }
    const auto* first = (*items)[0].getAsObject();
    const auto* last  = (*items)[2].getAsObject();
    if (first->getString("label") != llvm::StringRef("add") || first->getInteger("kind") != std::int64_t{3} ||
        first->getString("detail") != llvm::StringRef("game/math.fab") ||
        first->getObject("documentation")->getString("value") !=
            llvm::StringRef("```nesfab\n// Adds two numbers.\nfn add(U a, U b) U\n```") ||
        last->getString("label") != llvm::StringRef("total") || last->getInteger("kind") != std::int64_t{6})
    {
        std::cerr << "unexpected completion items\n";
        return false;
    }

    server.handleMessage(positionRequest(6, "textDocument/hover", mainUri, 40, 0));
    const auto empty = recorder.response(6);
    if (!empty || !empty->get("result") || empty->get("result")->kind() != llvm::json::Value::Null)
    {
        std::cerr << "unresolved hover should return null\n";
        return false;
    }

    server.handleMessage(positionRequest(7, "textDocument/rename", mainUri, 0, 0));
    if (errorCode(recorder.response(7)) != -32601)
    {
        std::cerr << "unknown methods should return method-not-found\n";
        return false;
    }

    server.handleMessage(llvm::json::Object{{"jsonrpc", "2.0"}, {"id", 8}, {"method", "textDocument/hover"}});
    if (errorCode(recorder.response(8)) != -32602)
    {
        std::cerr << "queries without a document should return invalid-params\n";
        return false;
    }

    server.handleMessage(llvm::json::Object{{"jsonrpc", "2.0"}, {"id", 9}});
    if (errorCode(recorder.response(9)) != -32600)
    {
        std::cerr << "messages without a method should return invalid-request\n";
        return false;
    }

    server.handleMessage(notification(
        "workspace/didChangeConfiguration",
        llvm::json::Object{{"settings", llvm::json::Object{{"fabls", llvm::json::Object{{"trace", "off"}}}}}}));
    const std::size_t logsBefore = recorder.logMessages().size();
    server.handleMessage(notification("textDocument/didSave",
                                      llvm::json::Object{{"textDocument", llvm::json::Object{{"uri", mainUri}}}}));
    if (recorder.logMessages().size() != logsBefore)
    {
        std::cerr << "trace off should silence informational logs\n";
        return false;
    }

    server.handleMessage(notification(
        "textDocument/didChange",
        llvm::json::Object{{"textDocument", llvm::json::Object{{"uri", mainUri}, {"version", 2}}},
                           {"contentChanges", llvm::json::Array{llvm::json::Object{{"text", "fn main(\n"}}}}}));
    if (recorder.logMessages().size() != logsBefore + 1 || *server.index().lookupText(mainPath) != "fn main(\n")
    {
        std::cerr << "indexing errors should always be logged\n";
        return false;
    }

    if (server.telemetry().requestCount("textDocument/hover") != 4 ||
        server.telemetry().resolvedCount("textDocument/hover") != 1 ||
        server.telemetry().requestCount("textDocument/definition") != 1)
    {
        std::cerr << "unexpected request telemetry\n";
        return false;
    }

    server.handleMessage(llvm::json::Object{{"jsonrpc", "2.0"}, {"id", 10}, {"method", "shutdown"}});
    server.handleMessage(notification("exit"));
    const auto shutdown = recorder.response(10);
    if (!shutdown || !shutdown->get("result") || !server.shutdownRequested() || !server.shouldExit() ||
        server.exitCode() != 0)
    {
        std::cerr << "shutdown then exit should end cleanly\n";
        return false;
    }
    return true;
}

bool testExitWithoutShutdown()
{
    MessageRecorder    recorder;
    fabls::lsp::Server server(recorder.sink());
    server.handleMessage(notification("exit"));
    if (!server.shouldExit() || server.exitCode() != 1)
    {
        std::cerr << "exit without shutdown should report failure\n";
        return false;
    }
    return true;
}

bool testWorkspaceFolderChanges()
{
    ScopedTempDir workspace("server-folders");
    ScopedTempDir extra("server-folders-extra");
    if (!writeTextFile(extra.path() / "lib/lib.fab", "fn helper()\n    return\n") ||
        !writeTextFile(extra.path() / "lib/lib.cfg", "input = lib.fab\n"))
    {
        std::cerr << "failed to create folder fixtures\n";
        return false;
    }
    const std::string extraUri = fabls::lsp::pathToFileUri(fabls::normalizePath(extra.path().string()));

    MessageRecorder    recorder;
    fabls::lsp::Server server(recorder.sink());
    server.handleMessage(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "initialize"},
        {"params", llvm::json::Object{{"rootUri", fabls::lsp::pathToFileUri(workspace.path().string())}}},
    });
    server.handleMessage(notification("initialized"));

    const auto folderEvent = [&extraUri](llvm::StringRef key) {
        return notification("workspace/didChangeWorkspaceFolders",
                            llvm::json::Object{{"event",
                                                llvm::json::Object{{key, llvm::json::Array{llvm::json::Object{
                                                                             {"uri", extraUri}, {"name", "extra"}}}}}}});
    };

    server.handleMessage(folderEvent("added"));
    server.waitForBackgroundWork();
    if (server.index().workspaceRoots().size() != 2 || server.index().dependencyGraph().size() != 1 ||
        !server.index().lookupSymbols(extra.file("lib/lib.fab")))
    {
        std::cerr << "added folders should be scanned and indexed\n";
        return false;
    }

    server.handleMessage(folderEvent("removed"));
    server.waitForBackgroundWork();
    if (server.index().workspaceRoots().size() != 1 || !server.index().dependencyGraph().empty())
    {
        std::cerr << "removed folders should drop their dependency entries\n";
        return false;
    }
    return true;
}

}  // namespace

bool runServerTests()
{
    return testSessionFlow() && testExitWithoutShutdown() && testWorkspaceFolderChanges();
}
