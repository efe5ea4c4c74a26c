#ifndef __CRITERION_HPP
#define __CRITERION_HPP

#include <vector>
#include <torch/torch.h>
#include "../config.hpp"

// Loss of one fit or evaluation and the per-row predictions it produced.
struct FIT_RESULT {
	float fLoss = 0.f;
	torch::Tensor tPreds;
};

// Loss bound to a task: mean squared error for regression, cross-entropy
// weighted per class by loss_weight for classification.
class Criterion {
public:
	Criterion(TaskType taskType, const std::vector<float> &lossWeight);

	// tOutput holds raw scores: [N, K] logits or [N] / [N, 1] values.
	torch::Tensor operator()(const torch::Tensor &tOutput,
			const torch::Tensor &tTarget) const;

	// Loss of [N, K] class probabilities, for models that emit probabilities.
	torch::Tensor FromProbabilities(const torch::Tensor &tProbs,
			const torch::Tensor &tTarget) const;

	// Class index per row (classify) or value per row (regress), on the CPU.
	torch::Tensor ToPredictions(const torch::Tensor &tOutput) const;

	// Labels as the loss expects them: int64 class indices or float values.
	torch::Tensor PrepareTarget(const torch::Tensor &tTarget,
			torch::Device device) const;

	void SetDevice(torch::Device device);

	// Width of the model output this criterion consumes.
	uint64_t NumOutputs() const;

private:
	TaskType m_TaskType;
	uint64_t m_nClasses;
	torch::Tensor m_tWeight;
};

// Throws ConfigurationError when class_labels is empty or its length differs
// from loss_weight for a classification task.
Criterion MakeCriterion(const RUN_CONFIG &conf);

#endif // #ifndef __CRITERION_HPP
