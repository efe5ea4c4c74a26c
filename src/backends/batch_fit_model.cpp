#include <algorithm>
#include <limits>
#include <boost/filesystem.hpp>
#include <glog/logging.h>
#include "../errors.hpp"
#include "batch_fit_model.hpp"

namespace bfs = boost::filesystem;

namespace {

void LGBMCheck(int nRet, const std::string &strWhat) {
	if (nRet != 0) {
		throw BackendError(strWhat + ": " + LGBM_GetLastError());
	}
}

class DatasetGuard {
public:
	explicit DatasetGuard(DatasetHandle hData) : m_hData(hData) {
	}
	~DatasetGuard() {
		if (m_hData != nullptr) {
			LGBM_DatasetFree(m_hData);
		}
	}
	DatasetGuard(const DatasetGuard&) = delete;
	DatasetGuard& operator=(const DatasetGuard&) = delete;

	DatasetHandle Get() const {
		return m_hData;
	}
	DatasetHandle Release() {
		DatasetHandle hData = m_hData;
		m_hData = nullptr;
		return hData;
	}

private:
	DatasetHandle m_hData;
};

// Columns of one flattened input row. Sequence loaders report the width of a
// single step, images already report C * H * W.
uint64_t FlatFeatureCount(const INPUT_SHAPE &shape) {
	if (shape.nImageHeight > 0) {
		return shape.nFeatureSize;
	}
	return shape.nFeatureSize * std::max<uint64_t>(shape.nSeqLen, 1);
}

} // namespace

BatchFitModel::BatchFitModel(const RUN_CONFIG &conf, const INPUT_SHAPE &shape,
		uint64_t nClasses, const SEED_CONTEXT &seedCtx)
	: m_Conf(conf.batchFit)
	, m_TaskType(conf.taskType)
	, m_nClasses(nClasses)
	, m_LossWeight(conf.lossWeight)
	, m_nFeatures(FlatFeatureCount(shape))
	, m_nSeed(seedCtx.nSeed) {
	if (conf.strModelType == "lightgbm") {
		m_strBoosting = "gbdt";
	} else if (conf.strModelType == "random_forest") {
		m_strBoosting = "rf";
	} else {
		throw ConfigurationError("\"" + conf.strModelType
				+ "\" is not a batch fit model");
	}
	if (m_nFeatures == 0) {
		throw ConfigurationError("batch fit models need a known feature size");
	}
	if (m_nFeatures > (uint64_t)std::numeric_limits<int32_t>::max()) {
		throw ConfigurationError(std::to_string(m_nFeatures)
				+ " features exceed what LightGBM accepts");
	}
	if (m_strBoosting == "rf" && !(m_Conf.fSubsample > 0 && m_Conf.fSubsample < 1)) {
		throw ConfigurationError("random_forest needs 0 < subsample < 1");
	}
	LOG(INFO) << "Built \"" << conf.strModelType << "\" ensemble on "
			<< m_nFeatures << " features";
}

BatchFitModel::~BatchFitModel() {
	__FreeBooster();
}

BatchFitModel::BatchFitModel(BatchFitModel &&other) noexcept
	: m_Conf(std::move(other.m_Conf))
	, m_strBoosting(std::move(other.m_strBoosting))
	, m_TaskType(other.m_TaskType)
	, m_nClasses(other.m_nClasses)
	, m_LossWeight(std::move(other.m_LossWeight))
	, m_nFeatures(other.m_nFeatures)
	, m_nSeed(other.m_nSeed)
	, m_hBooster(other.m_hBooster)
	, m_bStoppedEarly(other.m_bStoppedEarly) {
	other.m_hBooster = nullptr;
}

BatchFitModel& BatchFitModel::operator=(BatchFitModel &&other) noexcept {
	if (this != &other) {
		__FreeBooster();
		m_Conf = std::move(other.m_Conf);
		m_strBoosting = std::move(other.m_strBoosting);
		m_TaskType = other.m_TaskType;
		m_nClasses = other.m_nClasses;
		m_LossWeight = std::move(other.m_LossWeight);
		m_nFeatures = other.m_nFeatures;
		m_nSeed = other.m_nSeed;
		m_hBooster = other.m_hBooster;
		m_bStoppedEarly = other.m_bStoppedEarly;
		other.m_hBooster = nullptr;
	}
	return *this;
}

void BatchFitModel::__FreeBooster() {
	if (m_hBooster != nullptr) {
		LGBM_BoosterFree(m_hBooster);
		m_hBooster = nullptr;
	}
}

std::string BatchFitModel::__MakeDatasetParams() const {
	return "max_bin=" + std::to_string(m_Conf.nMaxBin)
			+ " verbosity=-1";
}

std::string BatchFitModel::__MakeParams() const {
	std::string strParams = "boosting=" + m_strBoosting;
	if (m_TaskType == TaskType::REGRESS) {
		strParams += " objective=regression metric=l2";
	} else if (m_nClasses == 2) {
		strParams += " objective=binary metric=binary_logloss";
	} else {
		strParams += " objective=multiclass metric=multi_logloss num_class="
				+ std::to_string(m_nClasses);
	}
	strParams += " learning_rate=" + std::to_string(m_Conf.fLearningRate)
			+ " num_leaves=" + std::to_string(m_Conf.nLeaves)
			+ " max_depth=" + std::to_string(m_Conf.nMaxDepth)
			+ " max_bin=" + std::to_string(m_Conf.nMaxBin)
			+ " min_data_in_leaf=" + std::to_string(m_Conf.nMinDataInLeaf)
			+ " lambda_l1=" + std::to_string(m_Conf.fRegAlpha)
			+ " lambda_l2=" + std::to_string(m_Conf.fRegLambda)
			+ " feature_fraction=" + std::to_string(m_Conf.fFeatureFraction)
			+ " num_threads=" + std::to_string(m_Conf.nJobs)
			+ " seed=" + std::to_string(m_nSeed)
			+ " deterministic=true is_provide_training_metric=true verbosity=-1";
	if (m_Conf.fSubsample > 0 && m_Conf.fSubsample < 1) {
		// bagging only runs with a positive frequency
		strParams += " bagging_fraction=" + std::to_string(m_Conf.fSubsample)
				+ " bagging_freq=1";
	}
	return strParams;
}

torch::Tensor BatchFitModel::__ToMatrix(const torch::Tensor &tInputs) const {
	CHECK(tInputs.defined());
	// checked before the copy below, LightGBM indexes rows with int32
	__RowCount(tInputs);
	auto tMatrix = tInputs.reshape({tInputs.size(0), -1}).to(
			torch::kCPU, torch::kFloat).contiguous();
	if (tMatrix.size(1) != (int64_t)m_nFeatures) {
		throw ConfigurationError("rows have " + std::to_string(tMatrix.size(1))
				+ " columns, the model expects " + std::to_string(m_nFeatures));
	}
	return tMatrix;
}

int32_t BatchFitModel::__RowCount(const torch::Tensor &tRows) const {
	if (tRows.size(0) > (int64_t)std::numeric_limits<int32_t>::max()) {
		throw BackendError(std::to_string(tRows.size(0))
				+ " rows exceed what LightGBM accepts in one matrix");
	}
	return (int32_t)tRows.size(0);
}

DatasetHandle BatchFitModel::__MakeDataset(const torch::Tensor &tMatrix,
		const torch::Tensor &tLabels, DatasetHandle hReference) const {
	int32_t nRows = __RowCount(tMatrix);
	auto tLabelVals = tLabels.reshape({-1}).to(torch::kCPU, torch::kFloat)
			.contiguous();
	CHECK_EQ(tLabelVals.size(0), nRows);

	DatasetHandle hData = nullptr;
	LGBMCheck(LGBM_DatasetCreateFromMat(tMatrix.data_ptr<float>(),
			C_API_DTYPE_FLOAT32, nRows, (int32_t)m_nFeatures, 1,
			__MakeDatasetParams().c_str(), hReference, &hData),
			"LGBM_DatasetCreateFromMat failed");
	DatasetGuard guard(hData);
	LGBMCheck(LGBM_DatasetSetField(hData, "label", tLabelVals.data_ptr<float>(),
			nRows, C_API_DTYPE_FLOAT32), "setting labels failed");

	if (m_TaskType == TaskType::CLASSIFY) {
		std::vector<float> weights(nRows);
		const float *pLabels = tLabelVals.data_ptr<float>();
		for (int32_t i = 0; i < nRows; ++i) {
			auto nLabel = (int64_t)pLabels[i];
			CHECK(nLabel >= 0 && nLabel < (int64_t)m_nClasses)
					<< "Label " << pLabels[i] << " out of range";
			weights[i] = m_LossWeight[nLabel];
		}
		LGBMCheck(LGBM_DatasetSetField(hData, "weight", weights.data(),
				nRows, C_API_DTYPE_FLOAT32), "setting weights failed");
	}
	return guard.Release();
}

float BatchFitModel::Fit(const torch::Tensor &tInputs,
		const torch::Tensor &tLabels, const torch::Tensor &tHeldInputs,
		const torch::Tensor &tHeldLabels) {
	auto tMatrix = __ToMatrix(tInputs);
	DatasetGuard trainData(__MakeDataset(tMatrix, tLabels, nullptr));

	bool bHeldOut = tHeldInputs.defined() && tHeldInputs.size(0) > 0;
	torch::Tensor tHeldMatrix;
	if (bHeldOut) {
		CHECK(tHeldLabels.defined());
		tHeldMatrix = __ToMatrix(tHeldInputs);
	}
	DatasetGuard heldData(bHeldOut ? __MakeDataset(tHeldMatrix, tHeldLabels,
			trainData.Get()) : nullptr);

	__FreeBooster();
	m_bStoppedEarly = false;
	LGBMCheck(LGBM_BoosterCreate(trainData.Get(), __MakeParams().c_str(),
			&m_hBooster), "LGBM_BoosterCreate failed");
	if (bHeldOut) {
		LGBMCheck(LGBM_BoosterAddValidData(m_hBooster, heldData.Get()),
				"LGBM_BoosterAddValidData failed");
	}
	int nEvalCnt = 0;
	LGBMCheck(LGBM_BoosterGetEvalCounts(m_hBooster, &nEvalCnt),
			"LGBM_BoosterGetEvalCounts failed");
	CHECK_GT(nEvalCnt, 0);
	std::vector<double> evals(nEvalCnt);

	// data index 0 is the training set, 1 the held-out set
	int nEvalData = bHeldOut ? 1 : 0;
	double dBest = std::numeric_limits<double>::infinity();
	double dLast = dBest;
	uint64_t nBestIter = 0;
	uint64_t nIter = 0;
	for (; nIter < m_Conf.nEstimators; ++nIter) {
		int nFinished = 0;
		LGBMCheck(LGBM_BoosterUpdateOneIter(m_hBooster, &nFinished),
				"LGBM_BoosterUpdateOneIter failed");
		if (nFinished) {
			break;
		}
		int nOutLen = 0;
		LGBMCheck(LGBM_BoosterGetEval(m_hBooster, nEvalData, &nOutLen,
				evals.data()), "LGBM_BoosterGetEval failed");
		dLast = evals[0];
		// every metric used here is lower-is-better
		if (dLast < dBest) {
			dBest = dLast;
			nBestIter = nIter;
		} else if (bHeldOut && m_Conf.bEarlyStopping
				&& nIter - nBestIter >= m_Conf.nEarlyStoppingRounds) {
			m_bStoppedEarly = true;
			break;
		}
	}

	if (bHeldOut && m_Conf.bEarlyStopping) {
		int nCurIter = NumIterations();
		for (int i = nCurIter; i > (int)nBestIter + 1; --i) {
			LGBMCheck(LGBM_BoosterRollbackOneIter(m_hBooster),
					"LGBM_BoosterRollbackOneIter failed");
		}
		if (m_bStoppedEarly) {
			LOG(INFO) << "Early stopped after " << nIter + 1
					<< " rounds, best round " << nBestIter + 1;
		}
		return (float)dBest;
	}
	return (float)dLast;
}

torch::Tensor BatchFitModel::PredictScores(const torch::Tensor &tInputs) const {
	if (m_hBooster == nullptr) {
		throw ModelNotFittedError("predict");
	}
	auto tMatrix = __ToMatrix(tInputs);
	int64_t nRows = __RowCount(tMatrix);
	int64_t nPerRow = (m_TaskType == TaskType::CLASSIFY && m_nClasses > 2)
			? (int64_t)m_nClasses : 1;
	std::vector<double> results(nRows * nPerRow);
	int64_t nOutLen = 0;
	LGBMCheck(LGBM_BoosterPredictForMat(m_hBooster, tMatrix.data_ptr<float>(),
			C_API_DTYPE_FLOAT32, (int32_t)nRows, (int32_t)m_nFeatures, 1,
			C_API_PREDICT_NORMAL, 0, -1, "", &nOutLen, results.data()),
			"LGBM_BoosterPredictForMat failed");
	CHECK_EQ(nOutLen, nRows * nPerRow);

	auto tScores = torch::tensor(results, torch::kDouble).to(torch::kFloat);
	if (m_TaskType == TaskType::REGRESS) {
		return tScores;
	}
	if (nPerRow == 1) {
		// binary objective emits the probability of class 1 only
		return torch::stack({1 - tScores, tScores}, 1);
	}
	return tScores.reshape({nRows, nPerRow});
}

torch::Tensor BatchFitModel::Predict(const torch::Tensor &tInputs,
		const Criterion &criterion) const {
	return criterion.ToPredictions(PredictScores(tInputs));
}

FIT_RESULT BatchFitModel::Evaluate(const torch::Tensor &tInputs,
		const torch::Tensor &tLabels, const Criterion &criterion) const {
	auto tScores = PredictScores(tInputs);
	auto tTarget = criterion.PrepareTarget(tLabels, torch::kCPU);
	FIT_RESULT result;
	if (m_TaskType == TaskType::CLASSIFY) {
		result.fLoss = criterion.FromProbabilities(tScores, tTarget).item<float>();
	} else {
		result.fLoss = criterion(tScores, tTarget).item<float>();
	}
	result.tPreds = criterion.ToPredictions(tScores);
	return result;
}

void BatchFitModel::SetDevice(torch::Device device) {
	if (!device.is_cpu()) {
		LOG(WARNING) << "LightGBM models run on the CPU only";
	}
}

void BatchFitModel::Save(const std::string &strFilename) const {
	if (m_hBooster == nullptr) {
		throw ModelNotFittedError("save");
	}
	StagedWrite(strFilename, [&](const std::string &strTmpFile) {
		LGBMCheck(LGBM_BoosterSaveModel(m_hBooster, 0, -1,
				C_API_FEATURE_IMPORTANCE_SPLIT, strTmpFile.c_str()),
				"LGBM_BoosterSaveModel failed");
	});
}

void BatchFitModel::Load(const std::string &strFilename) {
	if (!bfs::is_regular_file(strFilename)) {
		throw CheckpointLoadError(strFilename, "file not found");
	}
	BoosterHandle hBooster = nullptr;
	int nIters = 0;
	if (LGBM_BoosterCreateFromModelfile(strFilename.c_str(), &nIters,
			&hBooster) != 0) {
		throw CheckpointLoadError(strFilename, LGBM_GetLastError());
	}
	int nFeatures = 0;
	int nClasses = 0;
	if (LGBM_BoosterGetNumFeature(hBooster, &nFeatures) != 0
			|| LGBM_BoosterGetNumClasses(hBooster, &nClasses) != 0) {
		std::string strReason = LGBM_GetLastError();
		LGBM_BoosterFree(hBooster);
		throw CheckpointLoadError(strFilename, strReason);
	}
	int nExpectClasses = (m_TaskType == TaskType::CLASSIFY && m_nClasses > 2)
			? (int)m_nClasses : 1;
	if (nFeatures != (int)m_nFeatures || nClasses != nExpectClasses) {
		LGBM_BoosterFree(hBooster);
		throw CheckpointLoadError(strFilename, "model has " + std::to_string(
				nFeatures) + " features and " + std::to_string(nClasses)
				+ " outputs per row");
	}
	__FreeBooster();
	m_hBooster = hBooster;
	LOG(INFO) << "Loaded " << nIters << " boosting rounds from " << strFilename;
}

std::vector<double> BatchFitModel::FeatureImportance(bool bGain) const {
	if (m_hBooster == nullptr) {
		throw ModelNotFittedError("report feature importance");
	}
	std::vector<double> importance(m_nFeatures);
	LGBMCheck(LGBM_BoosterFeatureImportance(m_hBooster, 0, bGain
			? C_API_FEATURE_IMPORTANCE_GAIN : C_API_FEATURE_IMPORTANCE_SPLIT,
			importance.data()), "LGBM_BoosterFeatureImportance failed");
	return importance;
}

int BatchFitModel::NumIterations() const {
	int nIters = 0;
	if (m_hBooster != nullptr) {
		LGBMCheck(LGBM_BoosterGetCurrentIteration(m_hBooster, &nIters),
				"LGBM_BoosterGetCurrentIteration failed");
	}
	return nIters;
}
