#pragma once

#include "logging/ICallLogSink.hpp"
#include "resilience/CallResult.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace cafe::logging {

/**
 * @brief Выполнить вызов зависимости и записать dependency / outcome / latency
 */
template <typename T>
resilience::CallResult<T> timedCall(
    ICallLogSink& sink,
    const std::string& dependency,
    const std::string& operation,
    const std::function<resilience::CallResult<T>()>& call)
{
    auto started = std::chrono::steady_clock::now();
    auto result = call();
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    sink.record({dependency, operation, result.outcomeName(), latency});
    return result;
}

} // namespace cafe::logging
