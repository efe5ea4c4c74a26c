#include <fstream>
#include <sstream>
#include <unistd.h>
#include <boost/filesystem.hpp>
#include <glog/logging.h>
#include "errors.hpp"
#include "utils.hpp"

namespace bfs = boost::filesystem;

bool LoadFileContent(const std::string &strFn, std::string &strFileBuf) {
	std::ifstream inFile(strFn, std::ios::binary);
	if (!inFile.is_open()) {
		return false;
	}
	inFile.seekg(0, std::ios::end);
	strFileBuf.resize((uint64_t)inFile.tellg());
	inFile.seekg(0, std::ios::beg);
	inFile.read(const_cast<char*>(strFileBuf.data()), strFileBuf.size());
	return inFile.good();
}

nlohmann::json LoadJsonFile(const std::string &strFilename) {
	std::string strConfContent;
	if (!LoadFileContent(strFilename, strConfContent)) {
		throw ConfigurationError("cannot read config file \"" + strFilename + "\"");
	}
	try {
		return nlohmann::json::parse(strConfContent);
	} catch (const nlohmann::json::parse_error &e) {
		throw ConfigurationError("malformed config file \"" + strFilename
				+ "\": " + e.what());
	}
}

void MakeParentDirectory(const std::string &strFilename) {
	bfs::path parentPath = bfs::path(strFilename).parent_path();
	if (!parentPath.empty() && !bfs::exists(parentPath)) {
		bfs::create_directories(parentPath);
	}
}

void StagedWrite(const std::string &strFilename,
		const std::function<void(const std::string&)> &writer) {
	bfs::path target(strFilename);
	bfs::path staging = target;
	staging += ".tmp." + std::to_string(::getpid());
	try {
		writer(staging.string());
		bfs::rename(staging, target);
	} catch (...) {
		boost::system::error_code ec;
		bfs::remove(staging, ec);
		throw;
	}
}

std::vector<std::string> SplitString(const std::string &strLine, char delim) {
	std::vector<std::string> fields;
	std::istringstream iss(strLine);
	std::string strField;
	while (std::getline(iss, strField, delim)) {
		fields.emplace_back(std::move(strField));
	}
	if (!strLine.empty() && strLine.back() == delim) {
		fields.emplace_back();
	}
	return fields;
}
