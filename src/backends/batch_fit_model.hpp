#ifndef __BATCH_FIT_MODEL_HPP
#define __BATCH_FIT_MODEL_HPP

#include <string>
#include <vector>
#include <LightGBM/c_api.h>
#include "../config.hpp"
#include "../utils.hpp"
#include "criterion.hpp"

// A LightGBM tree ensemble fitted on a whole split at once. "lightgbm" boosts
// gradient trees, "random_forest" bags them.
class BatchFitModel {
public:
	BatchFitModel(const RUN_CONFIG &conf, const INPUT_SHAPE &shape,
			uint64_t nClasses, const SEED_CONTEXT &seedCtx);
	~BatchFitModel();

	BatchFitModel(BatchFitModel &&other) noexcept;
	BatchFitModel& operator=(BatchFitModel &&other) noexcept;
	BatchFitModel(const BatchFitModel&) = delete;
	BatchFitModel& operator=(const BatchFitModel&) = delete;

	// Replaces any previous booster. With held-out rows and early stopping
	// enabled, trees after the best held-out iteration are discarded. Returns
	// the best held-out metric, or the final training metric without
	// held-out rows.
	float Fit(const torch::Tensor &tInputs, const torch::Tensor &tLabels,
			const torch::Tensor &tHeldInputs = torch::Tensor(),
			const torch::Tensor &tHeldLabels = torch::Tensor());

	FIT_RESULT Evaluate(const torch::Tensor &tInputs,
			const torch::Tensor &tLabels, const Criterion &criterion) const;

	torch::Tensor Predict(const torch::Tensor &tInputs,
			const Criterion &criterion) const;

	// [N, K] class probabilities for classification, [N] values for regression.
	torch::Tensor PredictScores(const torch::Tensor &tInputs) const;

	void SetDevice(torch::Device device);
	void AnnealLR(float) {
	}
	void UpdateByEpoch(Phase) {
	}

	void Save(const std::string &strFilename) const;
	void Load(const std::string &strFilename);

	// Importance per input column, split counts or total gain over the kept
	// trees. The vector has one entry per column of the flattened input.
	std::vector<double> FeatureImportance(bool bGain = false) const;

	uint64_t NumFeatures() const {
		return m_nFeatures;
	}
	int NumIterations() const;
	bool StoppedEarly() const {
		return m_bStoppedEarly;
	}

private:
	std::string __MakeParams() const;
	std::string __MakeDatasetParams() const;
	torch::Tensor __ToMatrix(const torch::Tensor &tInputs) const;
	int32_t __RowCount(const torch::Tensor &tRows) const;
	DatasetHandle __MakeDataset(const torch::Tensor &tMatrix,
			const torch::Tensor &tLabels, DatasetHandle hReference) const;
	void __FreeBooster();

private:
	BATCH_FIT_CONFIG m_Conf;
	std::string m_strBoosting;
	TaskType m_TaskType;
	uint64_t m_nClasses;
	std::vector<float> m_LossWeight;
	uint64_t m_nFeatures;
	uint64_t m_nSeed;
	BoosterHandle m_hBooster = nullptr;
	bool m_bStoppedEarly = false;
};

#endif // #ifndef __BATCH_FIT_MODEL_HPP
