#ifndef _UTILS_HPP
#define _UTILS_HPP

#include <functional>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// The single seed of a run, handed to every subsystem that draws random
// numbers so each one owns an identically seeded generator.
struct SEED_CONTEXT {
	uint64_t nSeed = 0;

	std::mt19937 MakeGenerator() const {
		return std::mt19937(static_cast<uint32_t>(nSeed));
	}
};

bool LoadFileContent(const std::string &strFn, std::string &strFileBuf);

nlohmann::json LoadJsonFile(const std::string &strFilename);

// Creates the parent directory of strFilename if it is missing.
void MakeParentDirectory(const std::string &strFilename);

// Writes through a temporary sibling file and renames it over strFilename,
// so a reader never sees a half-written file at that path.
void StagedWrite(const std::string &strFilename,
		const std::function<void(const std::string&)> &writer);

std::vector<std::string> SplitString(const std::string &strLine, char delim);

#endif // _UTILS_HPP
