//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements LSP request dispatch and session state transitions.
///
//===----------------------------------------------------------------------===//

#include "fabls/LSP/Server.h"

#include "fabls/LSP/Uri.h"
#include "fabls/Version.h"

#include "llvm/ADT/Twine.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>

namespace fabls::lsp
{
namespace
{

constexpr int JsonRpcErrorInvalidRequest   = -32600;
constexpr int JsonRpcErrorMethodNotFound   = -32601;
constexpr int JsonRpcErrorInvalidParams    = -32602;
constexpr int JsonRpcErrorServerNotStarted = -32002;

constexpr int CompletionItemKindFunction = 3;
constexpr int CompletionItemKindVariable = 6;

const llvm::json::Object* getObject(const llvm::json::Object& parent, llvm::StringRef key)
{
    const auto* value = parent.get(key);
    return value ? value->getAsObject() : nullptr;
}

std::optional<std::string> parseTextDocumentUri(const llvm::json::Value* params)
{
    const auto* paramsObject = params ? params->getAsObject() : nullptr;
    if (!paramsObject)
    {
        return std::nullopt;
    }
    const auto* textDocument = getObject(*paramsObject, "textDocument");
    if (!textDocument)
    {
        return std::nullopt;
    }
    if (const auto uri = textDocument->getString("uri"))
    {
        return uri->str();
    }
    return std::nullopt;
}

std::optional<std::string> parseDidOpenText(const llvm::json::Value* params)
{
    const auto* paramsObject = params ? params->getAsObject() : nullptr;
    if (!paramsObject)
    {
        return std::nullopt;
    }
    const auto* textDocument = getObject(*paramsObject, "textDocument");
    if (!textDocument)
    {
        return std::nullopt;
    }
    if (const auto text = textDocument->getString("text"))
    {
        return text->str();
    }
    return std::nullopt;
}

std::optional<std::string> parseDidChangeText(const llvm::json::Value* params)
{
    const auto* paramsObject = params ? params->getAsObject() : nullptr;
    if (!paramsObject)
    {
        return std::nullopt;
    }
    const auto* changes = paramsObject->getArray("contentChanges");
    if (!changes || changes->empty())
    {
        return std::nullopt;
    }
    const auto* firstChange = (*changes)[0].getAsObject();
    if (!firstChange)
    {
        return std::nullopt;
    }
    if (const auto text = firstChange->getString("text"))
    {
        return text->str();
    }
    return std::nullopt;
}

struct DocumentPosition final
{
    std::string path;
    SourcePoint point;
};

std::optional<DocumentPosition> parseDocumentPosition(const llvm::json::Value* params)
{
    const auto uri = parseTextDocumentUri(params);
    if (!uri)
    {
        return std::nullopt;
    }
    const auto* position = getObject(*params->getAsObject(), "position");
    if (!position)
    {
        return std::nullopt;
    }

    const auto line      = position->getInteger("line");
    const auto character = position->getInteger("character");
    if (!line || !character || *line < 0 || *character < 0)
    {
        return std::nullopt;
    }

    std::string path = uriToNormalizedPath(*uri);
    if (path.empty())
    {
        return std::nullopt;
    }
    return DocumentPosition{std::move(path),
                            SourcePoint{static_cast<std::uint32_t>(*line), static_cast<std::uint32_t>(*character)}};
}

std::vector<std::string> parseWorkspaceFolderPaths(const llvm::json::Array* folders)
{
    std::vector<std::string> out;
    if (!folders)
    {
        return out;
    }
    for (const llvm::json::Value& folderValue : *folders)
    {
        const auto* folder = folderValue.getAsObject();
        if (!folder)
        {
            continue;
        }
        if (const auto uri = folder->getString("uri"))
        {
            std::string path = uriToNormalizedPath(*uri);
            if (!path.empty())
            {
                out.push_back(std::move(path));
            }
        }
    }
    return out;
}

llvm::json::Value pointToLsp(const SourcePoint& point)
{
    return llvm::json::Object{
        {"line", static_cast<std::int64_t>(point.row)},
        {"character", static_cast<std::int64_t>(point.column)},
    };
}

llvm::json::Value rangeToLsp(const SourceRange& range)
{
    return llvm::json::Object{
        {"start", pointToLsp(range.start)},
        {"end", pointToLsp(range.end)},
    };
}

llvm::json::Value cloneJsonId(const llvm::json::Value& id)
{
    if (const auto text = id.getAsString())
    {
        return llvm::json::Value(text->str());
    }
    if (const auto integer = id.getAsInteger())
    {
        return llvm::json::Value(*integer);
    }
    if (const auto number = id.getAsNumber())
    {
        return llvm::json::Value(*number);
    }
    return llvm::json::Value(nullptr);
}

}  // namespace

Server::Server(SendMessageFn sendMessage, ServerConfig config, RequestMetricSink metricSink)
    : sendMessage_(std::move(sendMessage))
    , config_(std::move(config))
    , traceLevel_(config_.traceLevel)
    , index_(parser_, config_.nesfabDirectory)
    , resolver_(index_)
{
    telemetry_.setSink(std::move(metricSink));
}

Server::~Server()
{
    shutdown();
}

void Server::handleMessage(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return;
    }

    const auto  method = object->getString("method");
    const auto* id     = object->get("id");
    if (!method)
    {
        if (id)
        {
            sendError(*id, JsonRpcErrorInvalidRequest, "missing method");
        }
        return;
    }

    if (id)
    {
        const auto start    = std::chrono::steady_clock::now();
        const bool resolved = handleRequest(*object, *method, *id);
        const auto finish   = std::chrono::steady_clock::now();
        telemetry_.record(*method,
                          static_cast<std::uint64_t>(
                              std::chrono::duration_cast<std::chrono::microseconds>(finish - start).count()),
                          resolved);
        return;
    }
    handleNotification(*object, *method);
}

bool Server::handleRequest(const llvm::json::Object& message, const llvm::StringRef method, const llvm::json::Value& id)
{
    const llvm::json::Value* params = message.get("params");

    if (method == "initialize")
    {
        sendResult(id, handleInitialize(params));
        return true;
    }

    if (!initialized_)
    {
        sendError(id, JsonRpcErrorServerNotStarted, "server not initialized");
        return false;
    }

    if (method == "shutdown")
    {
        logMessage(MessageType::Info, "shutdown.");
        shutdownRequested_ = true;
        sendResult(id, llvm::json::Value(nullptr));
        return true;
    }

    const bool isQuery =
        method == "textDocument/hover" || method == "textDocument/definition" || method == "textDocument/completion";
    if (!isQuery)
    {
        sendError(id, JsonRpcErrorMethodNotFound, "method not found: " + method.str());
        return false;
    }
    if (!parseTextDocumentUri(params))
    {
        sendError(id, JsonRpcErrorInvalidParams, "missing textDocument.uri");
        return false;
    }

    llvm::json::Value result(nullptr);
    if (method == "textDocument/hover")
    {
        result = handleHover(params);
    }
    else if (method == "textDocument/definition")
    {
        logMessage(MessageType::Log, "goto definition");
        result = handleDefinition(params);
    }
    else
    {
        result = handleCompletion(params);
    }

    const bool resolved = result.kind() != llvm::json::Value::Null;
    sendResult(id, std::move(result));
    return resolved;
}

void Server::handleNotification(const llvm::json::Object& message, const llvm::StringRef method)
{
    const llvm::json::Value* params = message.get("params");

    if (method == "exit")
    {
        shouldExit_ = true;
        if (!shutdownRequested_)
        {
            exitCode_ = 1;
        }
        return;
    }

    if (!initialized_)
    {
        return;
    }

    if (method == "initialized")
    {
        logMessage(MessageType::Info, "initialized.");
        postWorkspaceRefresh(index_.workspaceRoots(), {});
        return;
    }

    if (method == "textDocument/didOpen")
    {
        logMessage(MessageType::Info, "did open");
        const auto uri  = parseTextDocumentUri(params);
        auto       text = parseDidOpenText(params);
        if (uri && text)
        {
            updateDocument(*uri, std::move(*text));
        }
        return;
    }

    if (method == "textDocument/didChange")
    {
        logMessage(MessageType::Info, "did change");
        const auto uri  = parseTextDocumentUri(params);
        auto       text = parseDidChangeText(params);
        if (uri && text)
        {
            updateDocument(*uri, std::move(*text));
        }
        return;
    }

    if (method == "textDocument/didSave")
    {
        logMessage(MessageType::Info, "did save");
        return;
    }

    if (method == "textDocument/didClose")
    {
        logMessage(MessageType::Info, "did close");
        return;
    }

    if (method == "workspace/didChangeConfiguration")
    {
        logMessage(MessageType::Info, "did change configuration");
        if (!params || !applyDidChangeConfiguration(*params, config_))
        {
            return;
        }
        const std::string previous = index_.fallbackDirectory();
        applyConfig();
        if (previous != config_.nesfabDirectory)
        {
            postWorkspaceRefresh(index_.workspaceRoots(), {});
        }
        return;
    }

    if (method == "workspace/didChangeWorkspaceFolders")
    {
        logMessage(MessageType::Info, "did change workspace folders");
        const auto* paramsObject = params ? params->getAsObject() : nullptr;
        const auto* event        = paramsObject ? getObject(*paramsObject, "event") : nullptr;
        if (!event)
        {
            logMessage(MessageType::Error, "didChangeWorkspaceFolders without an event");
            return;
        }
        postWorkspaceRefresh(parseWorkspaceFolderPaths(event->getArray("added")),
                             parseWorkspaceFolderPaths(event->getArray("removed")));
        return;
    }
}

llvm::json::Value Server::handleInitialize(const llvm::json::Value* params)
{
    initialized_ = true;

    if (const auto* paramsObject = params ? params->getAsObject() : nullptr)
    {
        std::vector<std::string> roots = parseWorkspaceFolderPaths(paramsObject->getArray("workspaceFolders"));
        if (roots.empty())
        {
            if (const auto rootUri = paramsObject->getString("rootUri"))
            {
                roots.push_back(uriToNormalizedPath(*rootUri));
            }
            else if (const auto rootPath = paramsObject->getString("rootPath"))
            {
                roots.push_back(uriToNormalizedPath(*rootPath));
            }
        }
        index_.addWorkspaceRoots(roots);

        if (const auto* options = paramsObject->get("initializationOptions"))
        {
            if (applyInitializationOptions(*options, config_))
            {
                applyConfig();
            }
        }
    }

    llvm::json::Object result;
    result["capabilities"] = llvm::json::Object{
        {"textDocumentSync", 1},
        {"hoverProvider", true},
        {"definitionProvider", true},
        {"completionProvider", llvm::json::Object{}},
        {"workspace",
         llvm::json::Object{
             {"workspaceFolders", llvm::json::Object{{"supported", true}, {"changeNotifications", true}}}}},
    };
    result["serverInfo"] = llvm::json::Object{{"name", "fabd"}, {"version", kVersionString}};
    return llvm::json::Value(std::move(result));
}

llvm::json::Value Server::handleHover(const llvm::json::Value* params) const
{
    const auto position = parseDocumentPosition(params);
    if (!position)
    {
        return nullptr;
    }
    const auto hover = resolver_.hover(position->path, position->point);
    if (!hover)
    {
        return nullptr;
    }
    return llvm::json::Object{
        {"contents",
         llvm::json::Array{
             hover->displayPath,
             llvm::json::Object{{"language", "nesfab"}, {"value", hover->description}},
         }},
    };
}

llvm::json::Value Server::handleDefinition(const llvm::json::Value* params) const
{
    const auto position = parseDocumentPosition(params);
    if (!position)
    {
        return nullptr;
    }
    const auto definition = resolver_.gotoDefinition(position->path, position->point);
    if (!definition)
    {
        return nullptr;
    }
    return llvm::json::Object{
        {"uri", pathToFileUri(definition->filePath)},
        {"range", rangeToLsp(definition->range)},
    };
}

llvm::json::Value Server::handleCompletion(const llvm::json::Value* params) const
{
    const std::string path = uriToNormalizedPath(*parseTextDocumentUri(params));
    llvm::json::Array items;
    if (path.empty())
    {
        return llvm::json::Value(std::move(items));
    }
    for (const CompletionCandidate& candidate : resolver_.completion(path))
    {
        const int kind = candidate.kind == SymbolKind::Function ? CompletionItemKindFunction
                                                                 : CompletionItemKindVariable;
        items.push_back(llvm::json::Object{
            {"label", candidate.name},
            {"kind", kind},
            {"detail", resolver_.displayPath(candidate.filePath)},
            {"documentation",
             llvm::json::Object{
                 {"kind", "markdown"},
                 {"value", "```nesfab\n" + candidate.documentation + "\n```"},
             }},
        });
    }
    return llvm::json::Value(std::move(items));
}

void Server::applyConfig()
{
    traceLevel_ = config_.traceLevel;
    index_.setFallbackDirectory(config_.nesfabDirectory);
}

void Server::updateDocument(const std::string& uri, std::string text)
{
    const std::string path = uriToNormalizedPath(uri);
    if (path.empty())
    {
        logMessage(MessageType::Error, "unsupported document URI: " + uri);
        return;
    }
    if (llvm::Error error = index_.updateFile(path, std::move(text)))
    {
        logMessage(MessageType::Error, llvm::toString(std::move(error)));
        return;
    }
    logMessage(MessageType::Log, "symbol cached: " + path);
}

void Server::postWorkspaceRefresh(std::vector<std::string> added, std::vector<std::string> removed)
{
    const bool posted =
        workQueue_.post([this, added = std::move(added), removed = std::move(removed)]() {
            const RefreshReport report = index_.refreshWorkspace(added, removed);
            for (const IndexFailure& failure : report.failures)
            {
                logMessage(MessageType::Error, "failed to index " + failure.filePath + ": " + failure.message);
            }
            for (const std::string& file : report.indexedFiles)
            {
                logMessage(MessageType::Log, "symbol cached: " + file);
            }
            logMessage(MessageType::Info,
                       (llvm::Twine("workspace refreshed: ") + llvm::Twine(report.configDirectories.size()) +
                        " config directories, " + llvm::Twine(report.indexedFiles.size()) + " files indexed, " +
                        llvm::Twine(report.failures.size()) + " failures")
                           .str());
        });
    if (!posted)
    {
        logMessage(MessageType::Error, "workspace refresh rejected: server is shutting down");
    }
}

void Server::waitForBackgroundWork()
{
    workQueue_.waitIdle();
}

void Server::shutdown()
{
    workQueue_.shutdown();
}

void Server::sendResult(const llvm::json::Value& id, llvm::json::Value result)
{
    sendMessage_(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"result", std::move(result)},
    });
}

void Server::sendError(const llvm::json::Value& id, const int code, std::string message)
{
    sendMessage_(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"error", llvm::json::Object{{"code", code}, {"message", std::move(message)}}},
    });
}

void Server::sendNotification(std::string method, llvm::json::Value params)
{
    sendMessage_(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"method", std::move(method)},
        {"params", std::move(params)},
    });
}

void Server::logMessage(const MessageType type, const std::string& text)
{
    switch (type)
    {
    case MessageType::Error:
    case MessageType::Warning:
        break;
    case MessageType::Info:
        if (traceLevel_ == TraceLevel::Off)
        {
            return;
        }
        break;
    case MessageType::Log:
        if (traceLevel_ != TraceLevel::Verbose)
        {
            return;
        }
        break;
    }
    sendNotification("window/logMessage",
                     llvm::json::Object{
                         {"type", static_cast<int>(type)},
                         {"message", text},
                     });
}

}  // namespace fabls::lsp
