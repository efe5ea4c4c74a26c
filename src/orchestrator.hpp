#ifndef __ORCHESTRATOR_HPP
#define __ORCHESTRATOR_HPP

#include <map>
#include <memory>
#include <vector>
#include "config.hpp"
#include "utils.hpp"
#include "backends/model_backend.hpp"
#include "data_loaders/batch_loader.hpp"
#include "loggers/metric_logger.hpp"
#include "metrics/metrics_registry.hpp"

// Data sources by phase; not owned.
using LOADER_MAP = std::map<Phase, BatchLoader*>;

struct TEST_RESULT {
	std::vector<float> predictions;
	std::vector<float> labels;
	// rows are true classes, columns predicted classes; empty for regression
	std::vector<std::vector<int64_t>> confusionMatrix;
	NAMED_VALUES metrics;
};

// Drives one run: epochs of train/val phases over a single ModelBackend,
// metric book-keeping, checkpointing on validated improvement, then
// test or inference passes.
class TrainingOrchestrator {
public:
	TrainingOrchestrator(RUN_CONFIG conf, LOADER_MAP loaders,
			MetricsRegistry metrics, MetricLogger *pLogger = nullptr);

	// Needs TRAIN and VAL loaders.
	ModelBackend& Train();

	// Throws CheckpointLoadError when bLoadBest and no checkpoint exists.
	TEST_RESULT Test(bool bLoadBest = true);

	std::vector<float> Infer(bool bLoadBest = true);

	ModelBackend& Backend() {
		return *m_pBackend;
	}
	MetricsRegistry& Metrics() {
		return m_Metrics;
	}
	torch::Device Device() const {
		return m_Device;
	}
	const RUN_CONFIG& Config() const {
		return m_Conf;
	}
	// Epochs after which the model was saved.
	const std::vector<uint64_t>& SavedEpochs() const {
		return m_SavedEpochs;
	}

private:
	BatchLoader& __Loader(Phase phase) const;
	INPUT_SHAPE __QueryInputShape() const;
	torch::Device __SelectDevice() const;

	void __RunGradientPhase(uint64_t nEpoch, Phase phase);
	void __RunBatchFitPhase(uint64_t nEpoch, Phase phase);
	void __Materialize(Phase phase, torch::Tensor &tInputs,
			torch::Tensor &tLabels);
	void __LogFeatureImportance() const;
	void __EndOfPhase(uint64_t nEpoch, Phase phase);
	void __Verbose(uint64_t nEpoch, Phase phase, uint64_t nIter,
			uint64_t nTotal, float fLoss) const;
	void __Predict(Phase phase, std::vector<float> &preds,
			std::vector<float> &labels);

private:
	RUN_CONFIG m_Conf;
	SEED_CONTEXT m_SeedCtx;
	LOADER_MAP m_Loaders;
	MetricsRegistry m_Metrics;
	MetricLogger *m_pLogger;
	std::unique_ptr<ModelBackend> m_pBackend;
	torch::Device m_Device = torch::kCPU;
	std::vector<uint64_t> m_SavedEpochs;
};

#endif // #ifndef __ORCHESTRATOR_HPP
