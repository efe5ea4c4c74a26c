#include <glog/logging.h>
#include "../creator.hpp"
#include "../weights.hpp"
#include "gradient_model.hpp"

GradientModel::GradientModel(const RUN_CONFIG &conf, const INPUT_SHAPE &shape,
		uint64_t nOutputSize, const SEED_CONTEXT &seedCtx)
	: m_fMaxNorm(conf.gradient.fMaxNorm) {
	// libtorch draws initial weights from its process-wide generator.
	torch::manual_seed(seedCtx.nSeed);
	if (torch::cuda::is_available()) {
		torch::cuda::manual_seed_all(seedCtx.nSeed);
	}

	NETWORK_CONFIG netConf;
	netConf.gradient = conf.gradient;
	netConf.shape = shape;
	netConf.nOutputSize = nOutputSize;
	// Module::modules() needs the network to be owned by a shared_ptr.
	m_pNet = Creator<BasicModel, NETWORK_CONFIG>::Create(
			conf.strModelType, netConf);
	m_pNet->InitWeights(InitModuleWeight);

	m_pOptimizer = Creator<BasicOptimizer, OPTIMIZER_CONFIG>::Create(
			conf.gradient.optimizer.strName, conf.gradient.optimizer);
	m_pOptimizer->SetModel(*m_pNet);
	LOG(INFO) << "Built \"" << conf.strModelType << "\" network with "
			<< m_pNet->NamedParameters().size() << " parameter tensors, "
			<< conf.gradient.optimizer.strName << " optimizer";
}

void GradientModel::SetDevice(torch::Device device) {
	m_pNet->SetDevice(device);
	m_Device = device;
}

FIT_RESULT GradientModel::Fit(const torch::Tensor &tInputs,
		const torch::Tensor &tLabels, Phase phase, const Criterion &criterion) {
	CHECK(phase == Phase::TRAIN || phase == Phase::VAL)
			<< "Fit on phase " << PhaseName(phase);
	if (phase == Phase::VAL) {
		return Evaluate(tInputs, tLabels, criterion);
	}
	auto tTarget = criterion.PrepareTarget(tLabels, m_Device);
	m_pNet->TrainMode(true);
	m_pOptimizer->ZeroGrad();
	auto tOutput = m_pNet->Forward(tInputs.to(m_Device));
	auto tLoss = criterion(tOutput, tTarget);
	tLoss.backward();
	if (m_fMaxNorm > 0) {
		torch::nn::utils::clip_grad_norm_(m_pNet->parameters(), m_fMaxNorm);
	}
	m_pOptimizer->IterStep();

	FIT_RESULT result;
	result.fLoss = tLoss.item<float>();
	result.tPreds = criterion.ToPredictions(tOutput.detach());
	return result;
}

FIT_RESULT GradientModel::Evaluate(const torch::Tensor &tInputs,
		const torch::Tensor &tLabels, const Criterion &criterion) {
	torch::NoGradGuard noGrad;
	m_pNet->TrainMode(false);
	auto tOutput = m_pNet->Forward(tInputs.to(m_Device));
	auto tLoss = criterion(tOutput, criterion.PrepareTarget(tLabels, m_Device));

	FIT_RESULT result;
	result.fLoss = tLoss.item<float>();
	result.tPreds = criterion.ToPredictions(tOutput);
	return result;
}

torch::Tensor GradientModel::Predict(const torch::Tensor &tInputs,
		const Criterion &criterion) {
	torch::NoGradGuard noGrad;
	m_pNet->TrainMode(false);
	return criterion.ToPredictions(m_pNet->Forward(tInputs.to(m_Device)));
}

void GradientModel::AnnealLR(float fFactor) {
	m_pOptimizer->AnnealLR(fFactor);
	LOG(INFO) << "Learning rate annealed to " << m_pOptimizer->GetLR();
}

float GradientModel::LearningRate() const {
	return m_pOptimizer->GetLR();
}

void GradientModel::UpdateByEpoch(Phase) {
}

void GradientModel::Save(const std::string &strFilename) const {
	m_pNet->SaveWeights(strFilename);
}

void GradientModel::Load(const std::string &strFilename) {
	m_pNet->LoadWeights(strFilename);
}
