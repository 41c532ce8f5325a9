//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-method request latency counters with an optional forwarding sink.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_TELEMETRY_H
#define FABLS_LSP_TELEMETRY_H

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace fabls::lsp
{

/// @brief Sample for one answered request.
struct RequestMetric final
{
    std::string method;

    std::uint64_t latencyMicros{0};

    /// @brief Whether the request produced a non-null, non-error result.
    bool resolved{false};
};

using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Thread-safe request telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink for newly recorded samples; an empty sink disables forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Records one sample and forwards it to the sink.
    void record(llvm::StringRef method, std::uint64_t latencyMicros, bool resolved);

    [[nodiscard]] std::uint64_t requestCount(llvm::StringRef method) const;

    /// @brief Returns how many requests for `method` produced a result.
    [[nodiscard]] std::uint64_t resolvedCount(llvm::StringRef method) const;

    /// @brief Returns the summed latency of every request for `method`.
    [[nodiscard]] std::uint64_t totalLatencyMicros(llvm::StringRef method) const;

private:
    struct Counters final
    {
        std::uint64_t requests{0};
        std::uint64_t resolved{0};
        std::uint64_t latencyMicros{0};
    };

    [[nodiscard]] Counters countersFor(llvm::StringRef method) const;

    mutable std::mutex        mutex_;
    RequestMetricSink         sink_;
    llvm::StringMap<Counters> counters_;
};

}  // namespace fabls::lsp

#endif  // FABLS_LSP_TELEMETRY_H
