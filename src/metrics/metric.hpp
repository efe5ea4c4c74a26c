#ifndef __METRIC_HPP
#define __METRIC_HPP

#include <functional>
#include <map>
#include <string>
#include <torch/torch.h>
#include "../types.hpp"
#include "average_meter.hpp"

// Per-batch scalar computed from the batch loss, the predictions and the
// labels of that batch.
using METRIC_SCORER = std::function<float(float fLoss,
		const torch::Tensor &tPreds, const torch::Tensor &tLabels)>;

class Metric {
public:
	Metric(std::string strName, Direction direction, bool bSaveModel,
			METRIC_SCORER scorer);

	// Folds one batch into the phase's running average, weighted by the
	// number of rows in the batch.
	void Update(Phase phase, float fLoss, const torch::Tensor &tPreds,
			const torch::Tensor &tLabels);

	bool UpdateBest(Phase phase);

	void Reset(Phase phase);

	AverageMeter& Meter(Phase phase);
	const AverageMeter& Meter(Phase phase) const;

	const std::string& Name() const {
		return m_strName;
	}
	Direction GetDirection() const {
		return m_Direction;
	}
	bool SaveModel() const {
		return m_bSaveModel;
	}

private:
	std::string m_strName;
	Direction m_Direction;
	bool m_bSaveModel;
	METRIC_SCORER m_Scorer;
	std::map<Phase, AverageMeter> m_Meters;
};

// Built-in metrics: "loss", "accuracy", "f1" (macro), "mae", "mse", "rmse".
// nClasses is only used by "f1".
Metric MakeMetric(const std::string &strName, bool bSaveModel,
		uint64_t nClasses = 0);

float AccuracyScore(const torch::Tensor &tPreds, const torch::Tensor &tLabels);

float MacroF1Score(const torch::Tensor &tPreds, const torch::Tensor &tLabels,
		uint64_t nClasses);

#endif // #ifndef __METRIC_HPP
