#ifndef __JSON_LINES_LOGGER_HPP
#define __JSON_LINES_LOGGER_HPP

#include <fstream>
#include <string>
#include "metric_logger.hpp"

// Appends one JSON object per update: {"epoch": n, "<phase>_<metric>": v}.
class JsonLinesLogger : public MetricLogger {
public:
	explicit JsonLinesLogger(const std::string &strFilename);

	void Update(uint64_t nEpoch, const NAMED_VALUES &values) override;

private:
	std::string m_strFilename;
	std::ofstream m_File;
};

#endif // #ifndef __JSON_LINES_LOGGER_HPP
