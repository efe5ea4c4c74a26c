#include <glog/logging.h>
#include "../errors.hpp"
#include "model_backend.hpp"

ModelBackend::ModelBackend(const RUN_CONFIG &conf, const INPUT_SHAPE &shape,
		const SEED_CONTEXT &seedCtx)
	: m_strModelType(conf.strModelType)
	, m_strModelPath(conf.strModelPath)
	, m_Criterion(MakeCriterion(conf))
	, m_Model(__CreateModel(conf, shape, m_Criterion.NumOutputs(), seedCtx)) {
}

ModelBackend::MODEL_VARIANT ModelBackend::__CreateModel(const RUN_CONFIG &conf,
		const INPUT_SHAPE &shape, uint64_t nOutputSize,
		const SEED_CONTEXT &seedCtx) {
	if (conf.Kind() == ModelKind::GRADIENT) {
		return GradientModel(conf, shape, nOutputSize, seedCtx);
	}
	return BatchFitModel(conf, shape, nOutputSize, seedCtx);
}

ModelKind ModelBackend::Kind() const {
	return std::holds_alternative<GradientModel>(m_Model)
			? ModelKind::GRADIENT : ModelKind::BATCH_FIT;
}

bool ModelBackend::SupportsAccelerator() const {
	return Kind() == ModelKind::GRADIENT;
}

void ModelBackend::SetDevice(torch::Device device) {
	m_Criterion.SetDevice(device);
	std::visit([&](auto &model) {
		model.SetDevice(device);
	}, m_Model);
}

FIT_RESULT ModelBackend::Fit(const torch::Tensor &tInputs,
		const torch::Tensor &tLabels, Phase phase) {
	auto pModel = AsGradient();
	if (pModel == nullptr) {
		throw UnitrainError("\"" + m_strModelType
				+ "\" cannot be fitted batch by batch");
	}
	auto result = pModel->Fit(tInputs, tLabels, phase, m_Criterion);
	if (phase == Phase::TRAIN) {
		m_bFitted = true;
	}
	return result;
}

float ModelBackend::FitAll(const torch::Tensor &tInputs,
		const torch::Tensor &tLabels, const torch::Tensor &tHeldInputs,
		const torch::Tensor &tHeldLabels) {
	auto pModel = AsBatchFit();
	if (pModel == nullptr) {
		throw UnitrainError("\"" + m_strModelType
				+ "\" cannot be fitted on a whole split");
	}
	float fScore = pModel->Fit(tInputs, tLabels, tHeldInputs, tHeldLabels);
	m_bFitted = true;
	return fScore;
}

FIT_RESULT ModelBackend::Evaluate(const torch::Tensor &tInputs,
		const torch::Tensor &tLabels) {
	if (Kind() == ModelKind::BATCH_FIT && !m_bFitted) {
		throw ModelNotFittedError("evaluate");
	}
	return std::visit([&](auto &model) {
		return model.Evaluate(tInputs, tLabels, m_Criterion);
	}, m_Model);
}

torch::Tensor ModelBackend::Predict(const torch::Tensor &tInputs) {
	if (!m_bFitted) {
		throw ModelNotFittedError("predict");
	}
	return std::visit([&](auto &model) {
		return model.Predict(tInputs, m_Criterion);
	}, m_Model);
}

void ModelBackend::SaveModel() {
	if (!m_bFitted) {
		throw ModelNotFittedError("save");
	}
	MakeParentDirectory(m_strModelPath);
	std::visit([&](const auto &model) {
		model.Save(m_strModelPath);
	}, m_Model);
	LOG(INFO) << "Model saved to " << m_strModelPath;
}

void ModelBackend::LoadModel() {
	std::visit([&](auto &model) {
		model.Load(m_strModelPath);
	}, m_Model);
	m_bFitted = true;
	LOG(INFO) << "Model loaded from " << m_strModelPath;
}

void ModelBackend::AnnealLR(float fFactor) {
	std::visit([&](auto &model) {
		model.AnnealLR(fFactor);
	}, m_Model);
}

void ModelBackend::UpdateByEpoch(Phase phase) {
	std::visit([&](auto &model) {
		model.UpdateByEpoch(phase);
	}, m_Model);
}
