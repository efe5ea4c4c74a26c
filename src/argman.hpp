#ifndef __ARGMAN_HPP
#define __ARGMAN_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum ARG_FLAG {
	ARG_OPTIONAL = 0,
	ARG_REQUIRED = 1
};

class ArgMan {
public:
	using BASE_PARSER = std::function<void(const nlohmann::json &jValue)>;
	void Register(std::string strName, BASE_PARSER parser,
			ARG_FLAG flag = ARG_OPTIONAL);
	std::map<std::string, BASE_PARSER>& GetRegMap();
	const std::vector<std::string>& GetRequired() const;
private:
	std::map<std::string, BASE_PARSER> m_RegMap;
	std::vector<std::string> m_Required;
};

extern ArgMan g_MainArgs;

template<typename _Ty>
void Parser(const nlohmann::json &jValue, _Ty &val) {
	val = jValue.get<_Ty>();
}

template<> void Parser(const nlohmann::json &jValue, uint64_t &val);
template<> void Parser(const nlohmann::json &jValue, int32_t &val);
template<> void Parser(const nlohmann::json &jValue, float &val);
template<> void Parser(const nlohmann::json &jValue, bool &val);
template<> void Parser(const nlohmann::json &jValue, std::string &val);
template<> void Parser(const nlohmann::json &jValue, std::vector<float> &val);
template<> void Parser(const nlohmann::json &jValue,
		std::vector<std::string> &val);

template<typename _Ty>
class Arg {
public:
	using PARSER = std::function<void(const nlohmann::json &jValue, _Ty &val)>;
	Arg(std::string strName, const _Ty &defVal, PARSER parser,
			ArgMan &argman = g_MainArgs)
			: m_Var(defVal), m_Parser(std::move(parser)) {
		__Register(std::move(strName), ARG_OPTIONAL, argman);
	}
	Arg(std::string strName, const _Ty &defVal, ArgMan &argman = g_MainArgs)
			: m_Var(defVal), m_Parser(Parser<_Ty>) {
		__Register(std::move(strName), ARG_OPTIONAL, argman);
	}
	Arg(std::string strName, const _Ty &defVal, ARG_FLAG flag,
			ArgMan &argman = g_MainArgs)
			: m_Var(defVal), m_Parser(Parser<_Ty>) {
		__Register(std::move(strName), flag, argman);
	}
	Arg(std::string strName, ARG_FLAG flag, ArgMan &argman = g_MainArgs)
			: m_Var(), m_Parser(Parser<_Ty>) {
		__Register(std::move(strName), flag, argman);
	}
	Arg(std::string strName, ArgMan &argman = g_MainArgs)
			: m_Var(), m_Parser(Parser<_Ty>) {
		__Register(std::move(strName), ARG_OPTIONAL, argman);
	}
	Arg(const Arg&) = delete;
	Arg& operator=(const Arg&) = delete;

	void Set(const _Ty &val) {
		m_Var = val;
		m_bSet = true;
	}
	bool IsSet() const {
		return m_bSet;
	}
	_Ty& operator()() {
		return m_Var;
	}
	const _Ty& operator()() const {
		return m_Var;
	}
private:
	void __Register(std::string strName, ARG_FLAG flag, ArgMan &argman) {
		argman.Register(std::move(strName), [this](const nlohmann::json &jValue) {
			m_Parser(jValue, m_Var);
			m_bSet = true;
		}, flag);
	}

private:
	_Ty m_Var;
	bool m_bSet = false;
	PARSER m_Parser;
};

// Parses every registered key found in jCfg. Throws ConfigurationError
// listing all required keys absent from jCfg, or naming a key whose value
// has the wrong type.
void ParseArgsFromJson(const nlohmann::json &jCfg, ArgMan &argman = g_MainArgs);

std::vector<std::string> FindMissingArgs(const nlohmann::json &jCfg,
		const ArgMan &argman);

#endif // __ARGMAN_HPP
