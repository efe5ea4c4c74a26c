#ifndef __METRIC_LOGGER_HPP
#define __METRIC_LOGGER_HPP

#include "../types.hpp"

// Receives the per-epoch metric averages, keyed "<phase>_<metric>".
class MetricLogger {
public:
	virtual ~MetricLogger() = default;
	virtual void Update(uint64_t nEpoch, const NAMED_VALUES &values) = 0;
};

#endif // #ifndef __METRIC_LOGGER_HPP
