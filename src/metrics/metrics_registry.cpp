#include <glog/logging.h>
#include "../argman.hpp"
#include "../errors.hpp"
#include "metrics_registry.hpp"

MetricsRegistry::MetricsRegistry(std::vector<Metric> metrics)
	: m_Metrics(std::move(metrics)) {
}

void MetricsRegistry::Add(Metric metric) {
	m_Metrics.emplace_back(std::move(metric));
}

void MetricsRegistry::Update(Phase phase, float fLoss,
		const torch::Tensor &tPreds, const torch::Tensor &tLabels) {
	for (auto &metric : m_Metrics) {
		metric.Update(phase, fLoss, tPreds, tLabels);
	}
}

std::vector<bool> MetricsRegistry::UpdateBest(Phase phase) {
	std::vector<bool> improved;
	for (auto &metric : m_Metrics) {
		improved.push_back(metric.UpdateBest(phase));
	}
	return improved;
}

void MetricsRegistry::Reset(Phase phase) {
	for (auto &metric : m_Metrics) {
		metric.Reset(phase);
	}
}

NAMED_VALUES MetricsRegistry::Averages(Phase phase) const {
	NAMED_VALUES values;
	for (const auto &metric : m_Metrics) {
		values[PhaseName(phase) + "_" + metric.Name()]
				= metric.Meter(phase).Average();
	}
	return values;
}

Metric* MetricsRegistry::Find(const std::string &strName) {
	for (auto &metric : m_Metrics) {
		if (metric.Name() == strName) {
			return &metric;
		}
	}
	return nullptr;
}

MetricsRegistry CreateMetrics(const nlohmann::json &jMetrics,
		const RUN_CONFIG &conf) {
	const uint64_t nClasses = conf.classLabels.size();
	MetricsRegistry registry;
	if (jMetrics.is_null()) {
		registry.Add(MakeMetric("loss", true, nClasses));
		registry.Add(MakeMetric(conf.taskType == TaskType::CLASSIFY
				? "accuracy" : "mae", false, nClasses));
		return registry;
	}
	if (!jMetrics.is_array()) {
		throw ConfigurationError("metrics must be an array");
	}
	for (const auto &jMetric : jMetrics) {
		ArgMan argMan;
		Arg<std::string> argName("name", ARG_REQUIRED, argMan);
		Arg<bool> argSaveModel("save_model", false, argMan);
		ParseArgsFromJson(jMetric, argMan);
		if (registry.Find(argName()) != nullptr) {
			throw ConfigurationError("duplicated metric \"" + argName() + "\"");
		}
		registry.Add(MakeMetric(argName(), argSaveModel(), nClasses));
	}
	int nSaveCnt = 0;
	for (const auto &metric : registry) {
		nSaveCnt += metric.SaveModel() ? 1 : 0;
	}
	if (nSaveCnt == 0) {
		LOG(WARNING) << "No save-triggering metric, checkpoints are never written";
	}
	return registry;
}
