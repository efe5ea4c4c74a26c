#include <cmath>
#include <glog/logging.h>
#include "../errors.hpp"
#include "metric.hpp"

Metric::Metric(std::string strName, Direction direction, bool bSaveModel,
		METRIC_SCORER scorer)
	: m_strName(std::move(strName))
	, m_Direction(direction)
	, m_bSaveModel(bSaveModel)
	, m_Scorer(std::move(scorer)) {
	for (auto phase : {Phase::TRAIN, Phase::VAL, Phase::TEST, Phase::INFER}) {
		m_Meters.emplace(phase, AverageMeter(direction));
	}
}

void Metric::Update(Phase phase, float fLoss, const torch::Tensor &tPreds,
		const torch::Tensor &tLabels) {
	uint64_t nCount = 1;
	if (tPreds.defined() && tPreds.dim() > 0 && tPreds.size(0) > 0) {
		nCount = tPreds.size(0);
	}
	Meter(phase).Update(m_Scorer(fLoss, tPreds, tLabels), nCount);
}

bool Metric::UpdateBest(Phase phase) {
	return Meter(phase).UpdateBest();
}

void Metric::Reset(Phase phase) {
	Meter(phase).Reset();
}

AverageMeter& Metric::Meter(Phase phase) {
	return m_Meters.at(phase);
}

const AverageMeter& Metric::Meter(Phase phase) const {
	return m_Meters.at(phase);
}

float AccuracyScore(const torch::Tensor &tPreds, const torch::Tensor &tLabels) {
	CHECK_EQ(tPreds.numel(), tLabels.numel());
	if (tPreds.numel() == 0) {
		return 0.f;
	}
	auto tPred = tPreds.reshape({-1}).to(torch::kCPU, torch::kLong);
	auto tLabel = tLabels.reshape({-1}).to(torch::kCPU, torch::kLong);
	return tPred.eq(tLabel).to(torch::kFloat).mean().item<float>();
}

float MacroF1Score(const torch::Tensor &tPreds, const torch::Tensor &tLabels,
		uint64_t nClasses) {
	CHECK_EQ(tPreds.numel(), tLabels.numel());
	auto tPred = tPreds.reshape({-1}).to(torch::kCPU, torch::kLong);
	auto tLabel = tLabels.reshape({-1}).to(torch::kCPU, torch::kLong);
	float fSum = 0.f;
	uint64_t nPresent = 0;
	for (uint64_t c = 0; c < nClasses; ++c) {
		auto tIsPred = tPred.eq((int64_t)c);
		auto tIsLabel = tLabel.eq((int64_t)c);
		float fTP = tIsPred.logical_and(tIsLabel).sum().item<float>();
		float fPredCnt = tIsPred.sum().item<float>();
		float fLabelCnt = tIsLabel.sum().item<float>();
		if (fPredCnt + fLabelCnt == 0.f) {
			continue;
		}
		fSum += 2.f * fTP / (fPredCnt + fLabelCnt);
		++nPresent;
	}
	return nPresent == 0 ? 0.f : fSum / nPresent;
}

Metric MakeMetric(const std::string &strName, bool bSaveModel,
		uint64_t nClasses) {
	if (strName == "loss") {
		return Metric(strName, Direction::LOWER_IS_BETTER, bSaveModel,
			[](float fLoss, const torch::Tensor&, const torch::Tensor&) {
				return fLoss;
			});
	}
	if (strName == "accuracy") {
		return Metric(strName, Direction::HIGHER_IS_BETTER, bSaveModel,
			[](float, const torch::Tensor &tPreds, const torch::Tensor &tLabels) {
				return AccuracyScore(tPreds, tLabels);
			});
	}
	if (strName == "f1") {
		if (nClasses == 0) {
			throw ConfigurationError("metric f1 needs class_labels");
		}
		return Metric(strName, Direction::HIGHER_IS_BETTER, bSaveModel,
			[nClasses](float, const torch::Tensor &tPreds,
					const torch::Tensor &tLabels) {
				return MacroF1Score(tPreds, tLabels, nClasses);
			});
	}
	if (strName == "mae" || strName == "mse" || strName == "rmse") {
		bool bSquared = strName != "mae";
		bool bRoot = strName == "rmse";
		return Metric(strName, Direction::LOWER_IS_BETTER, bSaveModel,
			[bSquared, bRoot](float, const torch::Tensor &tPreds,
					const torch::Tensor &tLabels) {
				auto tDiff = tPreds.reshape({-1}).to(torch::kCPU, torch::kFloat)
						- tLabels.reshape({-1}).to(torch::kCPU, torch::kFloat);
				if (tDiff.numel() == 0) {
					return 0.f;
				}
				auto tErr = bSquared ? tDiff.pow(2) : tDiff.abs();
				float fErr = tErr.mean().item<float>();
				return bRoot ? std::sqrt(fErr) : fErr;
			});
	}
	throw ConfigurationError("unknown metric \"" + strName + "\"");
}
