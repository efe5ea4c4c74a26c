#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <glog/logging.h>
#include "errors.hpp"
#include "prediction_buffer.hpp"
#include "orchestrator.hpp"

TrainingOrchestrator::TrainingOrchestrator(RUN_CONFIG conf, LOADER_MAP loaders,
		MetricsRegistry metrics, MetricLogger *pLogger)
	: m_Conf(std::move(conf))
	, m_Loaders(std::move(loaders))
	, m_Metrics(std::move(metrics))
	, m_pLogger(pLogger) {
	for (auto iLoader = m_Loaders.begin(); iLoader != m_Loaders.end(); ) {
		if (iLoader->second == nullptr) {
			iLoader = m_Loaders.erase(iLoader);
		} else {
			++iLoader;
		}
	}
	if (m_Loaders.empty()) {
		throw ConfigurationError("no data source configured");
	}
	if (m_Conf.nBatchSize == 0) {
		throw ConfigurationError("batch_size must be positive");
	}
	m_SeedCtx.nSeed = m_Conf.nSeed;
	for (auto &loader : m_Loaders) {
		loader.second->SetSeed(m_SeedCtx);
	}

	m_pBackend.reset(new ModelBackend(m_Conf, __QueryInputShape(), m_SeedCtx));
	m_Device = __SelectDevice();
	m_pBackend->SetDevice(m_Device);
	MakeParentDirectory(m_Conf.strModelPath);
	LOG(INFO) << "Run ready: " << TaskTypeName(m_Conf.taskType) << " with \""
			<< m_Conf.strModelType << "\" on " << m_Device;
}

BatchLoader& TrainingOrchestrator::__Loader(Phase phase) const {
	auto iLoader = m_Loaders.find(phase);
	if (iLoader == m_Loaders.end()) {
		throw ConfigurationError("no data source for phase "
				+ PhaseName(phase));
	}
	return *iLoader->second;
}

INPUT_SHAPE TrainingOrchestrator::__QueryInputShape() const {
	auto iLoader = m_Loaders.find(Phase::TRAIN);
	if (iLoader == m_Loaders.end()) {
		iLoader = m_Loaders.begin();
	}
	return iLoader->second->GetInputShape();
}

torch::Device TrainingOrchestrator::__SelectDevice() const {
	if (!m_Conf.bCuda) {
		return torch::kCPU;
	}
	if (!m_pBackend->SupportsAccelerator()) {
		LOG(WARNING) << "\"" << m_Conf.strModelType
				<< "\" does not run on CUDA, using the CPU";
		return torch::kCPU;
	}
	if (!torch::cuda::is_available()) {
		throw ConfigurationError("cuda requested but no CUDA device is available");
	}
	return torch::Device(torch::kCUDA, (torch::DeviceIndex)m_Conf.nGpuId);
}

ModelBackend& TrainingOrchestrator::Train() {
	__Loader(Phase::TRAIN);
	__Loader(Phase::VAL);
	if (m_pBackend->Kind() == ModelKind::BATCH_FIT && m_Conf.nEpochs > 1) {
		LOG(WARNING) << "\"" << m_Conf.strModelType << "\" refits from scratch in "
				<< "each of the " << m_Conf.nEpochs << " epochs";
	}
	for (uint64_t nEpoch = 0; nEpoch < m_Conf.nEpochs; ++nEpoch) {
		for (Phase phase : {Phase::TRAIN, Phase::VAL}) {
			if (m_pBackend->Kind() == ModelKind::GRADIENT) {
				__RunGradientPhase(nEpoch, phase);
			} else {
				__RunBatchFitPhase(nEpoch, phase);
			}
			__EndOfPhase(nEpoch, phase);
		}
	}
	return *m_pBackend;
}

void TrainingOrchestrator::__RunGradientPhase(uint64_t nEpoch, Phase phase) {
	auto &loader = __Loader(phase);
	loader.ResetCursor();
	uint64_t nTotal = loader.NumBatches(m_Conf.nBatchSize);
	torch::Tensor tData, tTarget;
	for (uint64_t nIter = 0; loader.GetBatch(m_Conf.nBatchSize, tData, tTarget,
			m_Device); ++nIter) {
		CHECK(tTarget.defined()) << PhaseName(phase) << " data has no labels";
		auto result = m_pBackend->Fit(tData, tTarget, phase);
		m_Metrics.Update(phase, result.fLoss, result.tPreds, tTarget.cpu());
		if (!m_Conf.bSilent) {
			__Verbose(nEpoch, phase, nIter, nTotal, result.fLoss);
		}
	}
}

void TrainingOrchestrator::__Materialize(Phase phase, torch::Tensor &tInputs,
		torch::Tensor &tLabels) {
	auto &loader = __Loader(phase);
	loader.ResetCursor();
	TENSOR_ARY inputs, labels;
	torch::Tensor tData, tTarget;
	while (loader.GetBatch(m_Conf.nBatchSize, tData, tTarget, torch::kCPU)) {
		CHECK(tTarget.defined()) << PhaseName(phase) << " data has no labels";
		inputs.emplace_back(tData);
		labels.emplace_back(tTarget);
	}
	CHECK(!inputs.empty()) << PhaseName(phase) << " data is empty";
	tInputs = torch::cat(inputs);
	tLabels = torch::cat(labels);
}

void TrainingOrchestrator::__RunBatchFitPhase(uint64_t nEpoch, Phase phase) {
	torch::Tensor tInputs, tLabels;
	__Materialize(phase, tInputs, tLabels);
	if (phase == Phase::TRAIN) {
		torch::Tensor tHeldInputs, tHeldLabels;
		if (m_Conf.batchFit.bEarlyStopping && m_Loaders.count(Phase::VAL)) {
			__Materialize(Phase::VAL, tHeldInputs, tHeldLabels);
		}
		float fScore = m_pBackend->FitAll(tInputs, tLabels,
				tHeldInputs, tHeldLabels);
		LOG(INFO) << "epoch " << nEpoch << ": fitted on " << tInputs.size(0)
				<< " rows, score=" << fScore;
		__LogFeatureImportance();
	}
	auto result = m_pBackend->Evaluate(tInputs, tLabels);
	m_Metrics.Update(phase, result.fLoss, result.tPreds, tLabels);
	if (!m_Conf.bSilent) {
		__Verbose(nEpoch, phase, 0, 1, result.fLoss);
	}
}

void TrainingOrchestrator::__LogFeatureImportance() const {
	auto importance = m_pBackend->AsBatchFit()->FeatureImportance();
	std::vector<uint64_t> order(importance.size());
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [&](uint64_t a, uint64_t b) {
		return importance[a] > importance[b];
	});
	std::ostringstream ossLine;
	ossLine << "feature importance (split count):";
	const uint64_t nShown = std::min<uint64_t>(order.size(), 10);
	for (uint64_t i = 0; i < nShown; ++i) {
		ossLine << " " << order[i] << "=" << importance[order[i]];
	}
	LOG(INFO) << ossLine.str();
}

void TrainingOrchestrator::__Verbose(uint64_t nEpoch, Phase phase,
		uint64_t nIter, uint64_t nTotal, float fLoss) const {
	std::ostringstream ossLine;
	ossLine << "epoch " << nEpoch << " " << PhaseName(phase) << " ["
			<< nIter + 1 << "/" << nTotal << "] loss=" << std::setprecision(5)
			<< fLoss;
	for (const auto &metric : m_Metrics) {
		ossLine << ", " << metric.Name() << "="
				<< metric.Meter(phase).Average();
	}
	LOG(INFO) << ossLine.str();
}

void TrainingOrchestrator::__EndOfPhase(uint64_t nEpoch, Phase phase) {
	auto averages = m_Metrics.Averages(phase);
	if (m_pLogger != nullptr) {
		m_pLogger->Update(nEpoch, averages);
	}
	std::ostringstream ossSummary;
	for (const auto &value : averages) {
		ossSummary << " " << value.first << "=" << value.second;
	}
	LOG(INFO) << "epoch " << nEpoch << " " << PhaseName(phase) << ":"
			<< ossSummary.str();

	auto improved = m_Metrics.UpdateBest(phase);
	bool bSave = false;
	for (size_t i = 0; i < m_Metrics.Size(); ++i) {
		if (improved[i] && m_Metrics[i].SaveModel() && phase == Phase::VAL) {
			LOG(INFO) << "Found better validated model (" << m_Metrics[i].Name()
					<< "=" << m_Metrics[i].Meter(phase).Best() << ")";
			bSave = true;
		}
	}
	if (bSave) {
		m_pBackend->SaveModel();
		m_SavedEpochs.push_back(nEpoch);
	}
	m_Metrics.Reset(phase);

	if (phase == Phase::TRAIN) {
		m_pBackend->AnnealLR(m_Conf.fLearningAnneal);
		m_pBackend->UpdateByEpoch(phase);
	}
}

void TrainingOrchestrator::__Predict(Phase phase, std::vector<float> &preds,
		std::vector<float> &labels) {
	auto &loader = __Loader(phase);
	loader.ResetCursor();
	uint64_t nBatches = loader.NumBatches(m_Conf.nBatchSize);
	PredictionBuffer predBuf(nBatches, m_Conf.nBatchSize);
	PredictionBuffer labelBuf(nBatches, m_Conf.nBatchSize);
	torch::Device device = m_pBackend->SupportsAccelerator()
			? m_Device : torch::Device(torch::kCPU);
	torch::Tensor tData, tTarget;
	uint64_t nIter = 0;
	for (; loader.GetBatch(m_Conf.nBatchSize, tData, tTarget, device); ++nIter) {
		predBuf.Write(nIter, m_pBackend->Predict(tData));
		if (tTarget.defined()) {
			labelBuf.Write(nIter, tTarget);
		}
	}
	preds = predBuf.Collect();
	labels = labelBuf.Collect();
	if (!m_Conf.bSilent) {
		LOG(INFO) << PhaseName(phase) << ": predicted " << preds.size()
				<< " rows in " << nIter << " batches";
	}
}

TEST_RESULT TrainingOrchestrator::Test(bool bLoadBest) {
	auto &loader = __Loader(Phase::TEST);
	if (!loader.HasTargets()) {
		throw ConfigurationError("test data has no labels");
	}
	if (bLoadBest) {
		m_pBackend->LoadModel();
	}
	TEST_RESULT result;
	__Predict(Phase::TEST, result.predictions, result.labels);
	CHECK_EQ(result.predictions.size(), result.labels.size());

	auto tPreds = torch::tensor(result.predictions, torch::kFloat);
	auto tLabels = torch::tensor(result.labels, torch::kFloat);
	m_Metrics.Reset(Phase::TEST);
	for (auto &metric : m_Metrics) {
		float fLoss = 0.f;
		if (metric.Name() == "loss") {
			// class indices alone cannot give a cross-entropy
			if (m_Conf.taskType == TaskType::CLASSIFY) {
				continue;
			}
			fLoss = m_pBackend->GetCriterion()(tPreds, tLabels).item<float>();
		}
		metric.Update(Phase::TEST, fLoss, tPreds, tLabels);
		result.metrics[metric.Name()] = metric.Meter(Phase::TEST).Average();
		LOG(INFO) << "test " << metric.Name() << "="
				<< result.metrics[metric.Name()];
	}

	if (m_Conf.taskType == TaskType::CLASSIFY) {
		uint64_t nClasses = m_Conf.classLabels.size();
		result.confusionMatrix.assign(nClasses,
				std::vector<int64_t>(nClasses, 0));
		for (size_t i = 0; i < result.predictions.size(); ++i) {
			auto nTrue = (int64_t)result.labels[i];
			auto nPred = (int64_t)result.predictions[i];
			if (nTrue < 0 || nTrue >= (int64_t)nClasses
					|| nPred < 0 || nPred >= (int64_t)nClasses) {
				LOG(WARNING) << "Row " << i << " has a label out of range";
				continue;
			}
			++result.confusionMatrix[nTrue][nPred];
		}
		std::ostringstream ossMatrix;
		for (uint64_t i = 0; i < nClasses; ++i) {
			ossMatrix << "\n" << std::setw(12) << m_Conf.classLabels[i];
			for (auto nCount : result.confusionMatrix[i]) {
				ossMatrix << std::setw(8) << nCount;
			}
		}
		LOG(INFO) << "Confusion matrix (rows true, columns predicted):"
				<< ossMatrix.str();
	}
	return result;
}

std::vector<float> TrainingOrchestrator::Infer(bool bLoadBest) {
	__Loader(Phase::INFER);
	if (bLoadBest) {
		m_pBackend->LoadModel();
	}
	std::vector<float> preds, labels;
	__Predict(Phase::INFER, preds, labels);
	return preds;
}
