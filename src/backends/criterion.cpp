#include <glog/logging.h>
#include "../errors.hpp"
#include "criterion.hpp"

namespace tfunc = torch::nn::functional;

Criterion::Criterion(TaskType taskType, const std::vector<float> &lossWeight)
	: m_TaskType(taskType)
	, m_nClasses(lossWeight.size()) {
	if (m_TaskType == TaskType::CLASSIFY) {
		CHECK_GT(m_nClasses, 0);
		m_tWeight = torch::tensor(lossWeight, torch::kFloat);
	}
}

torch::Tensor Criterion::operator()(const torch::Tensor &tOutput,
		const torch::Tensor &tTarget) const {
	if (m_TaskType == TaskType::REGRESS) {
		return tfunc::mse_loss(tOutput.reshape({-1}),
				tTarget.reshape({-1}).to(tOutput.scalar_type()));
	}
	CHECK_EQ(tOutput.dim(), 2);
	return tfunc::cross_entropy(tOutput, tTarget.reshape({-1}).to(torch::kLong),
			tfunc::CrossEntropyFuncOptions().weight(
			m_tWeight.to(tOutput.device())));
}

torch::Tensor Criterion::FromProbabilities(const torch::Tensor &tProbs,
		const torch::Tensor &tTarget) const {
	CHECK(m_TaskType == TaskType::CLASSIFY);
	CHECK_EQ(tProbs.dim(), 2);
	auto tLogProbs = tProbs.clamp_min(1e-12).log();
	return tfunc::nll_loss(tLogProbs, tTarget.reshape({-1}).to(torch::kLong),
			tfunc::NLLLossFuncOptions().weight(m_tWeight.to(tProbs.device())));
}

torch::Tensor Criterion::ToPredictions(const torch::Tensor &tOutput) const {
	if (m_TaskType == TaskType::REGRESS) {
		return tOutput.reshape({-1}).to(torch::kCPU, torch::kFloat);
	}
	return tOutput.argmax(1).to(torch::kCPU, torch::kLong);
}

torch::Tensor Criterion::PrepareTarget(const torch::Tensor &tTarget,
		torch::Device device) const {
	CHECK(tTarget.defined());
	auto tOut = tTarget.reshape({-1});
	if (m_TaskType == TaskType::CLASSIFY) {
		tOut = tOut.to(device, torch::kLong);
	} else {
		tOut = tOut.to(device, torch::kFloat);
	}
	return tOut;
}

void Criterion::SetDevice(torch::Device device) {
	if (m_tWeight.defined()) {
		m_tWeight = m_tWeight.to(device);
	}
}

uint64_t Criterion::NumOutputs() const {
	return m_TaskType == TaskType::CLASSIFY ? m_nClasses : 1;
}

Criterion MakeCriterion(const RUN_CONFIG &conf) {
	if (conf.taskType == TaskType::REGRESS) {
		return Criterion(TaskType::REGRESS, {});
	}
	if (conf.classLabels.empty()) {
		throw ConfigurationError("class_labels must not be empty for classify");
	}
	if (conf.classLabels.size() != conf.lossWeight.size()) {
		throw ConfigurationError("loss_weight has "
				+ std::to_string(conf.lossWeight.size()) + " entries but there are "
				+ std::to_string(conf.classLabels.size()) + " class_labels");
	}
	return Criterion(TaskType::CLASSIFY, conf.lossWeight);
}
