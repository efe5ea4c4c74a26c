#ifndef __METRICS_REGISTRY_HPP
#define __METRICS_REGISTRY_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../config.hpp"
#include "metric.hpp"

// Ordered collection of metrics tracked through every phase of a run.
class MetricsRegistry {
public:
	MetricsRegistry() = default;
	explicit MetricsRegistry(std::vector<Metric> metrics);

	void Add(Metric metric);

	void Update(Phase phase, float fLoss, const torch::Tensor &tPreds,
			const torch::Tensor &tLabels);

	// One flag per metric, in registry order: whether that metric's phase
	// average improved on its best.
	std::vector<bool> UpdateBest(Phase phase);

	void Reset(Phase phase);

	// "<phase>_<metric>" -> current phase average.
	NAMED_VALUES Averages(Phase phase) const;

	Metric* Find(const std::string &strName);

	size_t Size() const {
		return m_Metrics.size();
	}
	Metric& operator[](size_t i) {
		return m_Metrics[i];
	}
	std::vector<Metric>::iterator begin() {
		return m_Metrics.begin();
	}
	std::vector<Metric>::iterator end() {
		return m_Metrics.end();
	}
	std::vector<Metric>::const_iterator begin() const {
		return m_Metrics.begin();
	}
	std::vector<Metric>::const_iterator end() const {
		return m_Metrics.end();
	}

private:
	std::vector<Metric> m_Metrics;
};

// Builds the registry from a "metrics" array such as
// [{"name": "loss", "save_model": true}, {"name": "accuracy"}].
// A null jMetrics gives loss (save-triggering) plus accuracy or mae.
MetricsRegistry CreateMetrics(const nlohmann::json &jMetrics,
		const RUN_CONFIG &conf);

#endif // #ifndef __METRICS_REGISTRY_HPP
