#ifndef __CONFIG_HPP
#define __CONFIG_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "types.hpp"

enum class ModelKind {
	GRADIENT, BATCH_FIT
};

struct OPTIMIZER_CONFIG {
	std::string strName = "adam";
	float fLearningRate = 1e-3f;
	float fMomentum = 0.9f;
	float fWeightDecay = 0.f;
};

// Hyperparameters of the gradient-trained networks ("rnn", "cnn").
struct GRADIENT_CONFIG {
	std::string strRNNType = "gru";
	uint64_t nHiddenSize = 400;
	uint64_t nLayers = 3;
	bool bBidirectional = true;
	bool bBatchNorm = true;
	float fMaxNorm = 400.f;
	uint64_t nConvChannels = 16;
	uint64_t nConvBlocks = 2;
	OPTIMIZER_CONFIG optimizer;
};

// Hyperparameters of the tree ensembles ("lightgbm", "random_forest").
struct BATCH_FIT_CONFIG {
	uint64_t nEstimators = 200;
	uint64_t nLeaves = 32;
	uint64_t nMaxBin = 255;
	int32_t nMaxDepth = 5;
	uint64_t nMinDataInLeaf = 50;
	float fRegAlpha = 0.5f;
	float fRegLambda = 0.5f;
	float fSubsample = 0.8f;
	float fFeatureFraction = 0.8f;
	float fLearningRate = 0.1f;
	uint64_t nJobs = 4;
	bool bEarlyStopping = true;
	uint64_t nEarlyStoppingRounds = 20;
};

struct RUN_CONFIG {
	TaskType taskType = TaskType::CLASSIFY;
	std::vector<std::string> classLabels;
	std::vector<float> lossWeight;
	std::string strModelType;
	std::string strModelPath;
	uint64_t nEpochs = 20;
	uint64_t nBatchSize = 32;
	uint64_t nSeed = 0;
	bool bCuda = false;
	uint64_t nGpuId = 0;
	float fLearningAnneal = 1.1f;
	bool bSilent = false;
	GRADIENT_CONFIG gradient;
	BATCH_FIT_CONFIG batchFit;

	ModelKind Kind() const;
};

// Throws ConfigurationError for model types nothing can build.
ModelKind ModelKindOf(const std::string &strModelType);

TaskType ParseTaskType(const std::string &strTaskType);

// Validates jConf once: every missing required key (for the task and model
// kind it names) is reported together in a single ConfigurationError.
RUN_CONFIG ParseRunConfig(const nlohmann::json &jConf);

#endif // #ifndef __CONFIG_HPP
