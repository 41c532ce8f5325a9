//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// `Content-Length` framed JSON-RPC over a pair of streams.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_JSON_RPC_IO_H
#define FABLS_LSP_JSON_RPC_IO_H

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>

namespace fabls::lsp
{

/// @brief JSON-RPC stdio transport with `Content-Length` framing.
///
/// Reads happen on one thread; writes may come from any thread.
class JsonRpcStdioTransport final
{
public:
    /// @brief Upper bound accepted for a single payload.
    static constexpr std::size_t MaxPayloadBytes = 64U * 1024U * 1024U;

    JsonRpcStdioTransport(std::istream& in, std::ostream& out);

    /// @brief Reads one framed message.
    ///
    /// Header names are matched case-insensitively; headers other than
    /// `Content-Length` are ignored.
    /// @return The parsed payload, `std::nullopt` on a clean end of input, or
    ///         a framing/JSON error.
    [[nodiscard]] llvm::Expected<std::optional<llvm::json::Value>> readMessage();

    /// @brief Serializes and writes one framed message.
    [[nodiscard]] llvm::Error writeMessage(const llvm::json::Value& message);

private:
    std::istream& input_;
    std::ostream& output_;
    std::mutex    writeMutex_;
};

}  // namespace fabls::lsp

#endif  // FABLS_LSP_JSON_RPC_IO_H
