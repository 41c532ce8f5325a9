//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request telemetry aggregation.
///
//===----------------------------------------------------------------------===//

#include "fabls/LSP/Telemetry.h"

#include <utility>

namespace fabls::lsp
{

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(llvm::StringRef method, const std::uint64_t latencyMicros, const bool resolved)
{
    RequestMetricSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Counters&                   counters = counters_[method];
        ++counters.requests;
        counters.latencyMicros += latencyMicros;
        if (resolved)
        {
            ++counters.resolved;
        }
        sink = sink_;
    }
    if (sink)
    {
        sink(RequestMetric{method.str(), latencyMicros, resolved});
    }
}

Telemetry::Counters Telemetry::countersFor(llvm::StringRef method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = counters_.find(method);
    return it == counters_.end() ? Counters{} : it->second;
}

std::uint64_t Telemetry::requestCount(llvm::StringRef method) const
{
    return countersFor(method).requests;
}

std::uint64_t Telemetry::resolvedCount(llvm::StringRef method) const
{
    return countersFor(method).resolved;
}

std::uint64_t Telemetry::totalLatencyMicros(llvm::StringRef method) const
{
    return countersFor(method).latencyMicros;
}

}  // namespace fabls::lsp
