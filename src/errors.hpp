#ifndef __ERRORS_HPP
#define __ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

class UnitrainError : public std::runtime_error {
public:
	explicit UnitrainError(const std::string &strMsg)
		: std::runtime_error(strMsg) {
	}
};

// Bad or incomplete run configuration. Raised while building objects and
// never retried.
class ConfigurationError : public UnitrainError {
public:
	explicit ConfigurationError(const std::string &strMsg);
	explicit ConfigurationError(const std::vector<std::string> &missingKeys);

	const std::vector<std::string>& MissingKeys() const {
		return m_MissingKeys;
	}

private:
	std::vector<std::string> m_MissingKeys;
};

class ModelNotFittedError : public UnitrainError {
public:
	explicit ModelNotFittedError(const std::string &strOperation);
};

class CheckpointLoadError : public UnitrainError {
public:
	CheckpointLoadError(const std::string &strPath, const std::string &strReason);

	const std::string& Path() const {
		return m_strPath;
	}

private:
	std::string m_strPath;
};

// A failure reported by a backend library (LightGBM's C API).
class BackendError : public UnitrainError {
public:
	explicit BackendError(const std::string &strMsg)
		: UnitrainError(strMsg) {
	}
};

#endif // #ifndef __ERRORS_HPP
