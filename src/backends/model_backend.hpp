#ifndef __MODEL_BACKEND_HPP
#define __MODEL_BACKEND_HPP

#include <variant>
#include "../config.hpp"
#include "../utils.hpp"
#include "criterion.hpp"
#include "gradient_model.hpp"
#include "batch_fit_model.hpp"

// One trainable model of either kind, behind a single surface. Capabilities
// differ per kind: only gradient models take per-batch Fit() calls and run
// on an accelerator; only batch fit models take FitAll().
class ModelBackend {
public:
	using MODEL_VARIANT = std::variant<GradientModel, BatchFitModel>;

	// Throws ConfigurationError on an inconsistent config, before any model
	// is built.
	ModelBackend(const RUN_CONFIG &conf, const INPUT_SHAPE &shape,
			const SEED_CONTEXT &seedCtx);

	ModelKind Kind() const;
	bool SupportsAccelerator() const;
	bool IsFitted() const {
		return m_bFitted;
	}
	void SetDevice(torch::Device device);

	// Gradient models only.
	FIT_RESULT Fit(const torch::Tensor &tInputs, const torch::Tensor &tLabels,
			Phase phase);

	// Batch fit models only. tHeldInputs may be undefined.
	float FitAll(const torch::Tensor &tInputs, const torch::Tensor &tLabels,
			const torch::Tensor &tHeldInputs, const torch::Tensor &tHeldLabels);

	// Loss and predictions without touching the weights.
	FIT_RESULT Evaluate(const torch::Tensor &tInputs,
			const torch::Tensor &tLabels);

	// Throws ModelNotFittedError before any fit or load.
	torch::Tensor Predict(const torch::Tensor &tInputs);

	// Writes to the configured model_path. Throws ModelNotFittedError before
	// any fit or load.
	void SaveModel();

	// Reads model_path. Throws CheckpointLoadError when it is missing or does
	// not match this model.
	void LoadModel();

	void AnnealLR(float fFactor);
	void UpdateByEpoch(Phase phase);

	const Criterion& GetCriterion() const {
		return m_Criterion;
	}
	const std::string& ModelPath() const {
		return m_strModelPath;
	}
	GradientModel* AsGradient() {
		return std::get_if<GradientModel>(&m_Model);
	}
	BatchFitModel* AsBatchFit() {
		return std::get_if<BatchFitModel>(&m_Model);
	}

private:
	static MODEL_VARIANT __CreateModel(const RUN_CONFIG &conf,
			const INPUT_SHAPE &shape, uint64_t nOutputSize,
			const SEED_CONTEXT &seedCtx);

private:
	std::string m_strModelType;
	std::string m_strModelPath;
	Criterion m_Criterion;
	MODEL_VARIANT m_Model;
	bool m_bFitted = false;
};

#endif // #ifndef __MODEL_BACKEND_HPP
