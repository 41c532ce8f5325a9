//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `fabd` NESFab language server.
///
/// By default the process runs a stdio JSON-RPC loop. `--dump-symbols <file>`
/// instead parses one source file and prints its symbol table as JSON.
///
//===----------------------------------------------------------------------===//

#include "fabls/Frontend/Parser.h"
#include "fabls/LSP/JsonRpcIO.h"
#include "fabls/LSP/Server.h"
#include "fabls/LSP/SymbolExtractor.h"
#include "fabls/Support/FileSystem.h"
#include "fabls/Version.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace
{

void printUsage()
{
    llvm::outs() << "usage: fabd [--nesfab-dir <dir>] [--trace off|basic|verbose]\n"
                 << "       fabd --dump-symbols <file.fab>\n"
                 << "       fabd --version\n";
}

int dumpSymbols(llvm::StringRef path)
{
    const std::string           key  = fabls::normalizePath(path);
    llvm::Expected<std::string> text = fabls::readTextFile(key);
    if (!text)
    {
        llvm::errs() << "[fabd] " << llvm::toString(text.takeError()) << "\n";
        return 1;
    }
    llvm::Expected<fabls::SyntaxTreeRef> tree = fabls::parseFabSource(key, std::move(*text));
    if (!tree)
    {
        llvm::errs() << "[fabd] " << llvm::toString(tree.takeError()) << "\n";
        return 1;
    }
    llvm::Expected<fabls::lsp::SymbolTable> table = fabls::lsp::extractSymbols(**tree, key);
    if (!table)
    {
        llvm::errs() << "[fabd] " << llvm::toString(table.takeError()) << "\n";
        return 1;
    }
    llvm::outs() << llvm::formatv("{0:2}", fabls::lsp::toJSON(*table)) << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    fabls::lsp::ServerConfig config;
    if (const auto env = llvm::sys::Process::GetEnv("NESFAB"))
    {
        config.nesfabDirectory = *env;
    }

    for (int i = 1; i < argc; ++i)
    {
        const llvm::StringRef arg(argv[i]);
        if (arg == "--version" || arg == "-V")
        {
            llvm::outs() << "fabd " << fabls::kVersionString << "\n";
            return 0;
        }
        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        const bool hasValue = i + 1 < argc;
        if (arg == "--dump-symbols" && hasValue)
        {
            return dumpSymbols(argv[i + 1]);
        }
        if (arg == "--nesfab-dir" && hasValue)
        {
            config.nesfabDirectory = argv[++i];
            continue;
        }
        if (arg == "--trace" && hasValue)
        {
            const llvm::StringRef level(argv[++i]);
            if (const std::optional<fabls::lsp::TraceLevel> parsed = fabls::lsp::parseTraceLevel(level))
            {
                config.traceLevel = *parsed;
                continue;
            }
            llvm::errs() << "[fabd] unknown trace level '" << level << "'\n";
            return 2;
        }
        llvm::errs() << "[fabd] unknown argument '" << arg << "'\n";
        printUsage();
        return 2;
    }

    const bool                        traceTelemetry = config.traceLevel == fabls::lsp::TraceLevel::Verbose;
    fabls::lsp::JsonRpcStdioTransport transport(std::cin, std::cout);
    fabls::lsp::Server                server(
        [&transport](llvm::json::Value message) {
            if (llvm::Error error = transport.writeMessage(message))
            {
                llvm::errs() << "[fabd] " << llvm::toString(std::move(error)) << "\n";
            }
        },
        config,
        [traceTelemetry](const fabls::lsp::RequestMetric& metric) {
            if (!traceTelemetry)
            {
                return;
            }
            llvm::errs() << "[fabd][telemetry] method=" << metric.method
                         << " latency_us=" << static_cast<std::uint64_t>(metric.latencyMicros)
                         << " resolved=" << (metric.resolved ? "true" : "false") << "\n";
        });

    while (!server.shouldExit())
    {
        llvm::Expected<std::optional<llvm::json::Value>> message = transport.readMessage();
        if (!message)
        {
            llvm::errs() << "[fabd] " << llvm::toString(message.takeError()) << "\n";
            server.shutdown();
            return 1;
        }
        if (!*message)
        {
            break;
        }
        server.handleMessage(**message);
    }

    server.shutdown();
    return server.exitCode();
}
