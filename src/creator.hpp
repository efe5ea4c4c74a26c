#ifndef __CREATOR_HPP
#define __CREATOR_HPP

#include <map>
#include <memory>
#include <functional>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "errors.hpp"

// Name-keyed factory. Objects are default-constructed by the registered
// creator, then initialized with a _CONF value.
template<typename _BASE, typename _CONF = nlohmann::json>
class Creator {
public:
	using BASE_PTR = std::unique_ptr<_BASE>;
	using CREATOR_FUNC = std::function<BASE_PTR()>;
	using CREATOR_MAP = std::map<std::string, CREATOR_FUNC>;

	static BASE_PTR Create(const std::string &strName, const _CONF &conf) {
		auto iCreator = __GetCreatorMap().find(strName);
		if (iCreator == __GetCreatorMap().end()) {
			throw ConfigurationError("unknown name \"" + strName + "\"");
		}
		BASE_PTR pObj = iCreator->second();
		pObj->Initialize(conf);
		return pObj;
	}

	// For json-configured objects: the json carries its own "name".
	static BASE_PTR Create(const nlohmann::json &jConf) {
		auto iType = jConf.find("name");
		if (iType == jConf.end() || !iType->is_string()) {
			throw ConfigurationError(std::vector<std::string>{"name"});
		}
		return Create(iType->get<std::string>(), jConf);
	}

	static void RegisterCreator(const std::string &strName,
			CREATOR_FUNC creator) {
		CHECK(!strName.empty()) << "Creator name is empty!";
		CHECK(__GetCreatorMap().find(strName) == __GetCreatorMap().end())
				<< "Name already exists: " << strName;
		__GetCreatorMap()[strName] = std::move(creator);
	}

private:
	static CREATOR_MAP& __GetCreatorMap() {
		static std::unique_ptr<CREATOR_MAP> pCreatorMap;
		if (pCreatorMap == nullptr) {
			pCreatorMap.reset(new CREATOR_MAP);
		}
		return *pCreatorMap;
	}
};

template<typename _BASE, typename _CLASS, typename _CONF = nlohmann::json>
class CreatorRegister {
public:
	CreatorRegister(const std::string &strName) {
		typename Creator<_BASE, _CONF>::CREATOR_FUNC creatorFunc = [=] {
			return std::unique_ptr<_BASE>(new _CLASS);
		};
		Creator<_BASE, _CONF>::RegisterCreator(strName, creatorFunc);
	}
};

#define REGISTER_CREATOR(base, _class, name) \
	CreatorRegister<base, _class> g_RegHelper_##_class(name);

#define REGISTER_CREATOR_CONF(base, _class, conf, name) \
	CreatorRegister<base, _class, conf> g_RegHelper_##_class(name);

#endif // #ifndef __CREATOR_HPP
