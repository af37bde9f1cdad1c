#pragma once

#include "logging/CallRecord.hpp"

namespace cafe::logging {

/**
 * @brief Приёмник журнала вызовов (dependency, outcome, latency)
 */
class ICallLogSink {
public:
    virtual ~ICallLogSink() = default;
    virtual void record(const CallRecord& call) = 0;
};

} // namespace cafe::logging
