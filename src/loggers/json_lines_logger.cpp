#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"
#include "../utils.hpp"
#include "json_lines_logger.hpp"

JsonLinesLogger::JsonLinesLogger(const std::string &strFilename)
	: m_strFilename(strFilename) {
	MakeParentDirectory(strFilename);
	m_File.open(strFilename, std::ios::app);
	if (!m_File.is_open()) {
		throw ConfigurationError("cannot open metric log \"" + strFilename + "\"");
	}
}

void JsonLinesLogger::Update(uint64_t nEpoch, const NAMED_VALUES &values) {
	nlohmann::json jLine;
	jLine["epoch"] = nEpoch;
	for (const auto &value : values) {
		jLine[value.first] = value.second;
	}
	m_File << jLine.dump() << std::endl;
	LOG_IF(WARNING, !m_File.good()) << "Failed writing " << m_strFilename;
}
