#include <fstream>
#include <memory>

#include <boost/filesystem.hpp>
#include <glog/logging.h>

#include "utils.hpp"
#include "argman.hpp"
#include "config.hpp"
#include "creator.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include "data_loaders/batch_loader.hpp"
#include "loggers/json_lines_logger.hpp"
#include "metrics/metrics_registry.hpp"

namespace bfs = boost::filesystem;

void WriteResults(const std::string &strFilename,
		const std::vector<float> &preds, const std::vector<float> &labels) {
	StagedWrite(strFilename, [&](const std::string &strTmpFile) {
		std::ofstream resultFile(strTmpFile);
		if (!resultFile.is_open()) {
			throw ConfigurationError("cannot write \"" + strFilename + "\"");
		}
		for (size_t i = 0; i < preds.size(); ++i) {
			resultFile << preds[i];
			if (i < labels.size()) {
				resultFile << "," << labels[i];
			}
			resultFile << "\n";
		}
	});
	LOG(INFO) << preds.size() << " results written to " << strFilename;
}

int Run(int nArgCnt, const char *ppArgs[]) {
	// Arguments Definitions
	// -------------------------------------------------------------------------
	Arg<std::string> argConfName("name");
	Arg<std::string> argMode("mode", "TRAIN");
	Arg<std::string> argLogPath("log_path");
	Arg<std::string> argResultFile("result_file");
	Arg<std::string> argMetricLog("metric_log");
	Arg<nlohmann::json> argTrainData("train_data");
	Arg<nlohmann::json> argValData("val_data");
	Arg<nlohmann::json> argTestData("test_data");
	Arg<nlohmann::json> argInferData("infer_data");
	Arg<nlohmann::json> argMetrics("metrics");

	// Configure Parsing and Arguments Checking
	// -------------------------------------------------------------------------
	auto jConf = LoadJsonFile(ppArgs[1]);
	if (nArgCnt > 2) {
		nlohmann::json jConfExt;
		try {
			jConfExt = nlohmann::json::parse(ppArgs[2]);
		} catch (const nlohmann::json::parse_error &e) {
			throw ConfigurationError(std::string("bad override: ") + e.what());
		}
		if (!jConfExt.is_object()) {
			throw ConfigurationError("override must be a JSON object");
		}
		for (auto jItem : jConfExt.items()) {
			jConf[jItem.key()] = jItem.value();
		}
	}
	ParseArgsFromJson(jConf);
	if (!argConfName.IsSet() || argConfName().empty()) {
		bfs::path confFile(ppArgs[1]);
		argConfName.Set(confFile.leaf().stem().string());
	}
	if (argMode() != "TRAIN" && argMode() != "TEST" && argMode() != "INFER") {
		throw ConfigurationError("unknown mode \"" + argMode() + "\"");
	}

	// Log Subsystem Initialization
	// -------------------------------------------------------------------------
	if (!argLogPath().empty()) {
		bfs::path logPath(argLogPath());
		if (!bfs::is_directory(logPath)) {
			throw ConfigurationError("log_path \"" + argLogPath()
					+ "\" is not a directory");
		}
		std::string strLeafName = argConfName() + ".log.";
		std::string strLogBaseName = (logPath / strLeafName).string();
		for (int i = 0; i < 4; ++i) {
			google::SetLogDestination(i, strLogBaseName.c_str());
			google::SetLogSymlink(i, "");
		}
	}
	LOG(INFO) << "Config File:\n" << jConf.dump(4);
	RUN_CONFIG conf = ParseRunConfig(jConf);

	// Data Loader Preparation
	// -------------------------------------------------------------------------
	std::vector<std::unique_ptr<BatchLoader>> loaders;
	LOADER_MAP loaderMap;
	auto AddLoader = [&](Phase phase, const nlohmann::json &jData) {
		if (!jData.is_null()) {
			loaders.emplace_back(Creator<BatchLoader>::Create(jData));
			loaderMap[phase] = loaders.back().get();
			LOG(INFO) << PhaseName(phase) << " data: "
					<< loaders.back()->Size() << " rows";
		}
	};
	if (argMode() == "TRAIN") {
		AddLoader(Phase::TRAIN, argTrainData());
		AddLoader(Phase::VAL, argValData());
	}
	if (argMode() != "INFER") {
		AddLoader(Phase::TEST, argTestData());
	} else {
		AddLoader(Phase::INFER, argInferData());
	}

	// Run
	// -------------------------------------------------------------------------
	std::unique_ptr<MetricLogger> pLogger;
	if (!argMetricLog().empty()) {
		pLogger.reset(new JsonLinesLogger(argMetricLog()));
	}
	TrainingOrchestrator orchestrator(conf, std::move(loaderMap),
			CreateMetrics(argMetrics(), conf), pLogger.get());
	if (argMode() == "TRAIN") {
		orchestrator.Train();
		if (argTestData().is_null()) {
			return 0;
		}
	}
	if (argMode() == "INFER") {
		auto preds = orchestrator.Infer();
		if (!argResultFile().empty()) {
			WriteResults(argResultFile(), preds, {});
		}
		return 0;
	}
	auto testResult = orchestrator.Test();
	if (!argResultFile().empty()) {
		WriteResults(argResultFile(), testResult.predictions, testResult.labels);
	}
	return 0;
}

int main(int nArgCnt, const char *ppArgs[]) {
	FLAGS_alsologtostderr = 1;
	google::InitGoogleLogging(ppArgs[0]);
	if (nArgCnt < 2) {
		LOG(ERROR) << "Usage: " << ppArgs[0] << " <config.json> [json-override]";
		return 1;
	}
	try {
		return Run(nArgCnt, ppArgs);
	} catch (const ConfigurationError &e) {
		LOG(ERROR) << e.what();
		for (const auto &strKey : e.MissingKeys()) {
			LOG(ERROR) << "  missing: " << strKey;
		}
	} catch (const CheckpointLoadError &e) {
		LOG(ERROR) << e.what() << " (train first or fix model_path)";
	} catch (const UnitrainError &e) {
		LOG(ERROR) << e.what();
	}
	return 1;
}
