#include <stdexcept>
#include <glog/logging.h>
#include "argman.hpp"
#include "errors.hpp"

ArgMan g_MainArgs;

void ArgMan::Register(std::string strName, ArgMan::BASE_PARSER parser,
		ARG_FLAG flag) {
	auto &regMap = GetRegMap();
	CHECK_EQ(regMap.count(strName), 0) << "Duplicated argument: " << strName;
	if (flag == ARG_REQUIRED) {
		m_Required.push_back(strName);
	}
	regMap[std::move(strName)] = std::move(parser);
}

std::map<std::string, ArgMan::BASE_PARSER>& ArgMan::GetRegMap() {
	return m_RegMap;
}

const std::vector<std::string>& ArgMan::GetRequired() const {
	return m_Required;
}

void ParseArgsFromJson(const nlohmann::json &jCfg, ArgMan &argman) {
	if (!jCfg.is_object()) {
		throw ConfigurationError("config must be a JSON object");
	}
	auto missingKeys = FindMissingArgs(jCfg, argman);
	if (!missingKeys.empty()) {
		throw ConfigurationError(missingKeys);
	}
	auto &regMap = argman.GetRegMap();
	for (auto &jArg : jCfg.items()) {
		auto iParser = regMap.find(jArg.key());
		if (iParser == regMap.end()) {
			continue;
		}
		try {
			iParser->second(jArg.value());
		} catch (const std::invalid_argument &e) {
			throw ConfigurationError("key \"" + jArg.key() + "\": " + e.what());
		} catch (const nlohmann::json::exception &e) {
			throw ConfigurationError("key \"" + jArg.key() + "\": " + e.what());
		}
	}
}

std::vector<std::string> FindMissingArgs(const nlohmann::json &jCfg,
		const ArgMan &argman) {
	std::vector<std::string> missingKeys;
	for (const auto &strKey : argman.GetRequired()) {
		if (!jCfg.is_object() || jCfg.find(strKey) == jCfg.end()) {
			missingKeys.push_back(strKey);
		}
	}
	return missingKeys;
}

template<>
void Parser(const nlohmann::json &jValue, uint64_t &val) {
	if (!jValue.is_number_unsigned()) {
		throw std::invalid_argument("expected an unsigned integer");
	}
	val = jValue.get<uint64_t>();
}

template<>
void Parser(const nlohmann::json &jValue, int32_t &val) {
	if (!jValue.is_number_integer()) {
		throw std::invalid_argument("expected an integer");
	}
	val = jValue.get<int32_t>();
}

template<>
void Parser(const nlohmann::json &jValue, float &val) {
	if (!jValue.is_number()) {
		throw std::invalid_argument("expected a number");
	}
	val = jValue.get<float>();
}

template<>
void Parser(const nlohmann::json &jValue, bool &val) {
	if (!jValue.is_boolean()) {
		throw std::invalid_argument("expected a boolean");
	}
	val = jValue.get<bool>();
}

template<>
void Parser(const nlohmann::json &jValue, std::string &val) {
	if (!jValue.is_string()) {
		throw std::invalid_argument("expected a string");
	}
	val = jValue.get<std::string>();
}

template<>
void Parser(const nlohmann::json &jValue, std::vector<float> &val) {
	if (!jValue.is_array()) {
		throw std::invalid_argument("expected an array of numbers");
	}
	val.clear();
	for (const auto &jItem : jValue) {
		if (!jItem.is_number()) {
			throw std::invalid_argument("expected an array of numbers");
		}
		val.push_back(jItem.get<float>());
	}
}

template<>
void Parser(const nlohmann::json &jValue, std::vector<std::string> &val) {
	if (!jValue.is_array()) {
		throw std::invalid_argument("expected an array of strings");
	}
	val.clear();
	for (const auto &jItem : jValue) {
		// Numeric labels are accepted and kept as their textual form.
		if (jItem.is_string()) {
			val.push_back(jItem.get<std::string>());
		} else if (jItem.is_number()) {
			val.push_back(jItem.dump());
		} else {
			throw std::invalid_argument("expected an array of labels");
		}
	}
}
