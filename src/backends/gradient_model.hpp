#ifndef __GRADIENT_MODEL_HPP
#define __GRADIENT_MODEL_HPP

#include <memory>
#include "../config.hpp"
#include "../utils.hpp"
#include "../models/basic_model.hpp"
#include "../optimizers/basic_optimizer.hpp"
#include "criterion.hpp"

// A network trained batch by batch with back-propagation.
class GradientModel {
public:
	// Seeds torch's global generator from seedCtx before the network is built,
	// so weight initialization is reproducible for a given seed.
	GradientModel(const RUN_CONFIG &conf, const INPUT_SHAPE &shape,
			uint64_t nOutputSize, const SEED_CONTEXT &seedCtx);

	void SetDevice(torch::Device device);
	torch::Device Device() const {
		return m_Device;
	}

	// TRAIN runs one optimization step, VAL only a forward pass. The returned
	// predictions live on the CPU.
	FIT_RESULT Fit(const torch::Tensor &tInputs, const torch::Tensor &tLabels,
			Phase phase, const Criterion &criterion);

	FIT_RESULT Evaluate(const torch::Tensor &tInputs,
			const torch::Tensor &tLabels, const Criterion &criterion);

	torch::Tensor Predict(const torch::Tensor &tInputs,
			const Criterion &criterion);

	void AnnealLR(float fFactor);
	float LearningRate() const;
	void UpdateByEpoch(Phase phase);

	void Save(const std::string &strFilename) const;
	void Load(const std::string &strFilename);

private:
	std::shared_ptr<BasicModel> m_pNet;
	std::unique_ptr<BasicOptimizer> m_pOptimizer;
	torch::Device m_Device = torch::kCPU;
	float m_fMaxNorm;
};

#endif // #ifndef __GRADIENT_MODEL_HPP
