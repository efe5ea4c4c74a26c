#include <sstream>
#include "errors.hpp"

namespace {

std::string JoinMissingKeys(const std::vector<std::string> &missingKeys) {
	std::ostringstream oss;
	oss << "missing required config key";
	if (missingKeys.size() > 1) {
		oss << "s";
	}
	oss << ": ";
	for (size_t i = 0; i < missingKeys.size(); ++i) {
		if (i > 0) {
			oss << ", ";
		}
		oss << missingKeys[i];
	}
	return oss.str();
}

} // namespace

ConfigurationError::ConfigurationError(const std::string &strMsg)
	: UnitrainError("configuration error: " + strMsg) {
}

ConfigurationError::ConfigurationError(
		const std::vector<std::string> &missingKeys)
	: UnitrainError("configuration error: " + JoinMissingKeys(missingKeys))
	, m_MissingKeys(missingKeys) {
}

ModelNotFittedError::ModelNotFittedError(const std::string &strOperation)
	: UnitrainError(strOperation + " called before the model was fitted or loaded") {
}

CheckpointLoadError::CheckpointLoadError(const std::string &strPath,
		const std::string &strReason)
	: UnitrainError("cannot load checkpoint \"" + strPath + "\": " + strReason)
	, m_strPath(strPath) {
}
