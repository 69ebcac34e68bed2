//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request telemetry recording and sink forwarding.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Support/Telemetry.h"

#include <utility>

namespace lspvisor
{

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(std::string method, const std::uint64_t latencyMicros, const RequestOutcome outcome)
{
    RequestMetricSink sink;
    RequestMetric     metric{method, latencyMicros, outcome};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Counters&                   counters = counters_[method];
        ++counters.total;
        if (outcome == RequestOutcome::TimedOut)
        {
            ++counters.timedOut;
        }
        sink = sink_;
    }
    if (sink)
    {
        sink(metric);
    }
}

std::uint64_t Telemetry::requestCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = counters_.find(std::string(method));
    return it == counters_.end() ? 0U : it->second.total;
}

std::uint64_t Telemetry::timeoutCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = counters_.find(std::string(method));
    return it == counters_.end() ? 0U : it->second.timedOut;
}

}  // namespace lspvisor
