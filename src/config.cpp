#include <glog/logging.h>
#include "argman.hpp"
#include "config.hpp"
#include "errors.hpp"

namespace {

std::string PeekString(const nlohmann::json &jConf, const std::string &strKey) {
	auto iVal = jConf.find(strKey);
	if (iVal != jConf.end() && iVal->is_string()) {
		return iVal->get<std::string>();
	}
	return std::string();
}

} // namespace

ModelKind RUN_CONFIG::Kind() const {
	return ModelKindOf(strModelType);
}

ModelKind ModelKindOf(const std::string &strModelType) {
	if (strModelType == "rnn" || strModelType == "cnn") {
		return ModelKind::GRADIENT;
	}
	if (strModelType == "lightgbm" || strModelType == "random_forest") {
		return ModelKind::BATCH_FIT;
	}
	throw ConfigurationError("unsupported model_type \"" + strModelType + "\"");
}

TaskType ParseTaskType(const std::string &strTaskType) {
	if (strTaskType == "classify") {
		return TaskType::CLASSIFY;
	}
	if (strTaskType == "regress") {
		return TaskType::REGRESS;
	}
	throw ConfigurationError("task_type must be classify or regress, got \""
			+ strTaskType + "\"");
}

RUN_CONFIG ParseRunConfig(const nlohmann::json &jSrcConf) {
	if (!jSrcConf.is_object()) {
		throw ConfigurationError("config must be a JSON object");
	}
	nlohmann::json jConf = jSrcConf;
	if (jConf.count("class_labels") == 0 && jConf.count("class_names") != 0) {
		jConf["class_labels"] = jConf["class_names"];
	}

	const std::string strTaskType = PeekString(jConf, "task_type");
	const std::string strModelType = PeekString(jConf, "model_type");
	const bool bClassify = strTaskType == "classify";
	const bool bRNN = strModelType == "rnn";
	const bool bGradient = bRNN || strModelType == "cnn";
	const bool bBatchFit = strModelType == "lightgbm"
			|| strModelType == "random_forest";
	RUN_CONFIG defConf;

	// Common keys
	// -------------------------------------------------------------------------
	ArgMan commonMan;
	Arg<std::string> argTaskType("task_type", ARG_REQUIRED, commonMan);
	Arg<std::string> argModelType("model_type", ARG_REQUIRED, commonMan);
	Arg<std::string> argModelPath("model_path", ARG_REQUIRED, commonMan);
	Arg<uint64_t> argEpochs("epochs", ARG_REQUIRED, commonMan);
	Arg<uint64_t> argBatchSize("batch_size", ARG_REQUIRED, commonMan);
	Arg<uint64_t> argSeed("seed", ARG_REQUIRED, commonMan);
	Arg<bool> argCuda("cuda", ARG_REQUIRED, commonMan);
	Arg<uint64_t> argGpuId("gpu_id", defConf.nGpuId, commonMan);
	Arg<float> argLearningAnneal("learning_anneal", ARG_REQUIRED, commonMan);
	Arg<bool> argSilent("silent", ARG_REQUIRED, commonMan);

	ArgMan classifyMan;
	const ARG_FLAG classFlag = bClassify ? ARG_REQUIRED : ARG_OPTIONAL;
	Arg<std::vector<std::string>> argClassLabels("class_labels",
			std::vector<std::string>(), classFlag, classifyMan);
	Arg<std::vector<float>> argLossWeight("loss_weight",
			std::vector<float>(), classFlag, classifyMan);

	// Gradient model keys
	// -------------------------------------------------------------------------
	const GRADIENT_CONFIG &defGrad = defConf.gradient;
	const ARG_FLAG rnnFlag = bRNN ? ARG_REQUIRED : ARG_OPTIONAL;
	const ARG_FLAG gradFlag = bGradient ? ARG_REQUIRED : ARG_OPTIONAL;
	ArgMan gradientMan;
	Arg<std::string> argRNNType("rnn_type", defGrad.strRNNType, gradientMan);
	Arg<uint64_t> argHiddenSize("rnn_hidden_size", defGrad.nHiddenSize,
			rnnFlag, gradientMan);
	Arg<uint64_t> argLayers("rnn_n_layers", defGrad.nLayers,
			rnnFlag, gradientMan);
	Arg<bool> argBidirectional("bidirectional", defGrad.bBidirectional,
			rnnFlag, gradientMan);
	Arg<bool> argBatchNorm("batch_norm", defGrad.bBatchNorm,
			gradFlag, gradientMan);
	Arg<float> argMaxNorm("max_norm", defGrad.fMaxNorm, gradientMan);
	Arg<uint64_t> argConvChannels("cnn_channels", defGrad.nConvChannels,
			gradientMan);
	Arg<uint64_t> argConvBlocks("cnn_blocks", defGrad.nConvBlocks, gradientMan);
	Arg<std::string> argOptimizer("optimizer", defGrad.optimizer.strName,
			gradientMan);
	Arg<float> argLR("lr", defGrad.optimizer.fLearningRate, gradientMan);
	Arg<float> argMomentum("momentum", defGrad.optimizer.fMomentum,
			gradientMan);
	Arg<float> argWeightDecay("weight_decay", defGrad.optimizer.fWeightDecay,
			gradientMan);

	// Batch-fit model keys
	// -------------------------------------------------------------------------
	const BATCH_FIT_CONFIG &defFit = defConf.batchFit;
	const ARG_FLAG fitFlag = bBatchFit ? ARG_REQUIRED : ARG_OPTIONAL;
	ArgMan batchFitMan;
	Arg<uint64_t> argEstimators("n_estimators", defFit.nEstimators,
			fitFlag, batchFitMan);
	Arg<int32_t> argMaxDepth("max_depth", defFit.nMaxDepth,
			fitFlag, batchFitMan);
	Arg<float> argRegAlpha("reg_alpha", defFit.fRegAlpha, fitFlag, batchFitMan);
	Arg<float> argRegLambda("reg_lambda", defFit.fRegLambda,
			fitFlag, batchFitMan);
	Arg<uint64_t> argLeaves("n_leaves", defFit.nLeaves, batchFitMan);
	Arg<uint64_t> argMaxBin("max_bin", defFit.nMaxBin, batchFitMan);
	Arg<uint64_t> argMinDataInLeaf("min_data_in_leaf", defFit.nMinDataInLeaf,
			batchFitMan);
	Arg<float> argSubsample("subsample", defFit.fSubsample, batchFitMan);
	Arg<float> argFeatureFraction("feature_fraction", defFit.fFeatureFraction,
			batchFitMan);
	Arg<float> argFitLR("tree_lr", defFit.fLearningRate, batchFitMan);
	Arg<uint64_t> argJobs("n_jobs", defFit.nJobs, batchFitMan);
	Arg<bool> argEarlyStopping("early_stopping", defFit.bEarlyStopping,
			batchFitMan);
	Arg<uint64_t> argEarlyStoppingRounds("early_stopping_rounds",
			defFit.nEarlyStoppingRounds, batchFitMan);

	std::vector<std::string> missingKeys;
	for (const ArgMan *pMan : {&commonMan, &classifyMan, &gradientMan,
			&batchFitMan}) {
		auto missing = FindMissingArgs(jConf, *pMan);
		missingKeys.insert(missingKeys.end(), missing.begin(), missing.end());
	}
	if (!missingKeys.empty()) {
		throw ConfigurationError(missingKeys);
	}
	ParseArgsFromJson(jConf, commonMan);
	ParseArgsFromJson(jConf, classifyMan);
	ParseArgsFromJson(jConf, gradientMan);
	ParseArgsFromJson(jConf, batchFitMan);

	RUN_CONFIG conf;
	conf.taskType = ParseTaskType(argTaskType());
	conf.strModelType = argModelType();
	ModelKindOf(conf.strModelType);
	conf.classLabels = argClassLabels();
	conf.lossWeight = argLossWeight();
	conf.strModelPath = argModelPath();
	if (conf.strModelPath.empty()) {
		throw ConfigurationError("model_path is empty");
	}
	conf.nEpochs = argEpochs();
	conf.nBatchSize = argBatchSize();
	if (conf.nBatchSize == 0) {
		throw ConfigurationError("batch_size must be positive");
	}
	conf.nSeed = argSeed();
	conf.bCuda = argCuda();
	conf.nGpuId = argGpuId();
	conf.fLearningAnneal = argLearningAnneal();
	if (conf.fLearningAnneal <= 0.f) {
		throw ConfigurationError("learning_anneal must be positive");
	}
	conf.bSilent = argSilent();

	conf.gradient.strRNNType = argRNNType();
	conf.gradient.nHiddenSize = argHiddenSize();
	conf.gradient.nLayers = argLayers();
	conf.gradient.bBidirectional = argBidirectional();
	conf.gradient.bBatchNorm = argBatchNorm();
	conf.gradient.fMaxNorm = argMaxNorm();
	conf.gradient.nConvChannels = argConvChannels();
	conf.gradient.nConvBlocks = argConvBlocks();
	conf.gradient.optimizer.strName = argOptimizer();
	conf.gradient.optimizer.fLearningRate = argLR();
	conf.gradient.optimizer.fMomentum = argMomentum();
	conf.gradient.optimizer.fWeightDecay = argWeightDecay();
	if (bRNN && (conf.gradient.nHiddenSize == 0 || conf.gradient.nLayers == 0)) {
		throw ConfigurationError("rnn_hidden_size and rnn_n_layers must be positive");
	}

	conf.batchFit.nEstimators = argEstimators();
	conf.batchFit.nMaxDepth = argMaxDepth();
	conf.batchFit.fRegAlpha = argRegAlpha();
	conf.batchFit.fRegLambda = argRegLambda();
	conf.batchFit.nLeaves = argLeaves();
	conf.batchFit.nMaxBin = argMaxBin();
	conf.batchFit.nMinDataInLeaf = argMinDataInLeaf();
	conf.batchFit.fSubsample = argSubsample();
	conf.batchFit.fFeatureFraction = argFeatureFraction();
	conf.batchFit.fLearningRate = argFitLR();
	conf.batchFit.nJobs = argJobs();
	conf.batchFit.bEarlyStopping = argEarlyStopping();
	conf.batchFit.nEarlyStoppingRounds = argEarlyStoppingRounds();
	if (bBatchFit && conf.batchFit.nEstimators == 0) {
		throw ConfigurationError("n_estimators must be positive");
	}

	if (conf.taskType == TaskType::REGRESS && !conf.lossWeight.empty()) {
		LOG(WARNING) << "loss_weight is ignored for regress tasks";
	}
	return conf;
}
