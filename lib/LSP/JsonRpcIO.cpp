//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framed JSON-RPC transport.
///
//===----------------------------------------------------------------------===//

#include "fabls/LSP/JsonRpcIO.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <istream>
#include <ostream>
#include <string>
#include <system_error>

namespace fabls::lsp
{
namespace
{

llvm::Error makeTransportError(const llvm::Twine& message)
{
    return llvm::createStringError(std::make_error_code(std::errc::protocol_error), message);
}

/// Returns the value of a `Content-Length` header line, or no value when the
/// line carries another header. Malformed lengths are reported as errors.
llvm::Expected<std::optional<std::size_t>> parseContentLengthHeader(llvm::StringRef line)
{
    const std::size_t colon = line.find(':');
    if (colon == llvm::StringRef::npos)
    {
        return makeTransportError("malformed header line '" + line + "'");
    }
    if (!line.take_front(colon).trim().equals_insensitive("content-length"))
    {
        return std::nullopt;
    }

    const llvm::StringRef digits = line.drop_front(colon + 1).trim();
    unsigned long long    value  = 0;
    if (digits.getAsInteger(10, value))
    {
        return makeTransportError("invalid Content-Length '" + digits + "'");
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

JsonRpcStdioTransport::JsonRpcStdioTransport(std::istream& in, std::ostream& out)
    : input_(in)
    , output_(out)
{
}

llvm::Expected<std::optional<llvm::json::Value>> JsonRpcStdioTransport::readMessage()
{
    std::optional<std::size_t> contentLength;
    bool                       sawHeader = false;
    std::string                line;
    while (std::getline(input_, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            if (!sawHeader)
            {
                continue;
            }
            break;
        }

        sawHeader = true;
        llvm::Expected<std::optional<std::size_t>> parsed = parseContentLengthHeader(line);
        if (!parsed)
        {
            return parsed.takeError();
        }
        if (*parsed)
        {
            contentLength = **parsed;
        }
    }

    if (!sawHeader)
    {
        return std::nullopt;
    }
    if (!contentLength)
    {
        return makeTransportError("missing Content-Length header");
    }
    if (*contentLength > MaxPayloadBytes)
    {
        return makeTransportError("Content-Length " + llvm::Twine(*contentLength) + " exceeds limit");
    }

    std::string payload(*contentLength, '\0');
    input_.read(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (input_.gcount() != static_cast<std::streamsize>(payload.size()))
    {
        return makeTransportError("truncated JSON-RPC payload");
    }

    llvm::Expected<llvm::json::Value> message = llvm::json::parse(payload);
    if (!message)
    {
        return makeTransportError("invalid JSON payload: " + llvm::toString(message.takeError()));
    }
    return std::optional<llvm::json::Value>(std::move(*message));
}

llvm::Error JsonRpcStdioTransport::writeMessage(const llvm::json::Value& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << message;
    payloadStream.flush();

    std::lock_guard<std::mutex> lock(writeMutex_);
    output_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    output_.flush();
    if (!output_)
    {
        return makeTransportError("failed to write JSON-RPC message");
    }
    return llvm::Error::success();
}

}  // namespace fabls::lsp
