#include <fstream>
#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include "../src/errors.hpp"
#include "../src/orchestrator.hpp"
#include "../src/loggers/json_lines_logger.hpp"
#include "../src/data_loaders/tensor_loader.hpp"
#include "test_utils.hpp"

namespace {

// Hands out a fixed sequence of values, one per scored batch.
Metric MakeScriptedMetric(std::vector<float> values) {
	auto pCursor = std::make_shared<size_t>(0);
	return Metric("scripted", Direction::LOWER_IS_BETTER, true,
		[values, pCursor](float, const torch::Tensor&, const torch::Tensor&) {
			float fValue = values[*pCursor % values.size()];
			++*pCursor;
			return fValue;
		});
}

class RecordingLogger : public MetricLogger {
public:
	void Update(uint64_t nEpoch, const NAMED_VALUES &values) override {
		epochs.push_back(nEpoch);
		updates.push_back(values);
	}
	std::vector<uint64_t> epochs;
	std::vector<NAMED_VALUES> updates;
};

torch::Tensor SequenceLabels(const torch::Tensor &tInputs) {
	return (tInputs.select(1, 0).select(1, 0) > 0.5).to(torch::kFloat);
}

class OrchestratorTest : public ::testing::Test {
protected:
	void SetUp() override {
		torch::manual_seed(0);
		auto tTrain = torch::rand({4, 3, 2});
		auto tVal = torch::rand({4, 3, 2});
		auto tTest = torch::rand({10, 3, 2});
		m_pTrain.reset(new TensorLoader(tTrain, SequenceLabels(tTrain)));
		m_pVal.reset(new TensorLoader(tVal, SequenceLabels(tVal)));
		m_pTest.reset(new TensorLoader(tTest, SequenceLabels(tTest)));
		m_pInfer.reset(new TensorLoader(torch::rand({7, 3, 2}), torch::Tensor()));
	}

	LOADER_MAP AllLoaders() {
		return LOADER_MAP{{Phase::TRAIN, m_pTrain.get()},
				{Phase::VAL, m_pVal.get()}, {Phase::TEST, m_pTest.get()},
				{Phase::INFER, m_pInfer.get()}};
	}

	TempDir m_Tmp;
	std::unique_ptr<TensorLoader> m_pTrain;
	std::unique_ptr<TensorLoader> m_pVal;
	std::unique_ptr<TensorLoader> m_pTest;
	std::unique_ptr<TensorLoader> m_pInfer;
};

} // namespace

TEST_F(OrchestratorTest, SavesOnlyWhenValidationImproves) {
	auto conf = MakeRnnConfig(m_Tmp.File("run/model.pkl"));
	conf.nEpochs = 2;
	MetricsRegistry metrics;
	// train e0, val e0, train e1, val e1
	metrics.Add(MakeScriptedMetric({1.f, 0.5f, 1.f, 0.6f}));
	RecordingLogger logger;
	TrainingOrchestrator orchestrator(conf, AllLoaders(), std::move(metrics),
			&logger);
	orchestrator.Train();

	ASSERT_EQ(orchestrator.SavedEpochs().size(), 1u);
	EXPECT_EQ(orchestrator.SavedEpochs()[0], 0u);
	EXPECT_TRUE(boost::filesystem::exists(conf.strModelPath));

	ASSERT_EQ(logger.updates.size(), 4u);
	EXPECT_EQ(logger.epochs, (std::vector<uint64_t>{0, 0, 1, 1}));
	EXPECT_FLOAT_EQ(logger.updates[1].at("val_scripted"), 0.5f);
	EXPECT_FLOAT_EQ(logger.updates[3].at("val_scripted"), 0.6f);
	EXPECT_EQ(logger.updates[0].count("train_scripted"), 1u);
}

TEST_F(OrchestratorTest, TrainingImprovementNeverSaves) {
	auto conf = MakeRnnConfig(m_Tmp.File("model.pkl"));
	MetricsRegistry metrics;
	// train improves, val gets worse after the first epoch
	metrics.Add(MakeScriptedMetric({1.f, 0.5f, 0.1f, 0.9f}));
	TrainingOrchestrator orchestrator(conf, AllLoaders(), std::move(metrics));
	orchestrator.Train();
	EXPECT_EQ(orchestrator.SavedEpochs(), std::vector<uint64_t>{0});
}

TEST_F(OrchestratorTest, TestWithoutCheckpointFails) {
	auto conf = MakeRnnConfig(m_Tmp.File("never/written.pkl"));
	TrainingOrchestrator orchestrator(conf, AllLoaders(),
			CreateMetrics(nlohmann::json(), conf));
	EXPECT_THROW(orchestrator.Test(true), CheckpointLoadError);
	EXPECT_THROW(orchestrator.Infer(true), CheckpointLoadError);
}

TEST_F(OrchestratorTest, TestAggregatesShortFinalBatch) {
	auto conf = MakeRnnConfig(m_Tmp.File("model.pkl"));
	TrainingOrchestrator orchestrator(conf, AllLoaders(),
			CreateMetrics(nlohmann::json(), conf));
	orchestrator.Train();
	ASSERT_FALSE(orchestrator.SavedEpochs().empty());

	// 10 rows in batches of 4
	auto result = orchestrator.Test(true);
	ASSERT_EQ(result.predictions.size(), 10u);
	ASSERT_EQ(result.labels.size(), 10u);
	ASSERT_EQ(result.confusionMatrix.size(), 2u);
	int64_t nTotal = 0;
	for (const auto &row : result.confusionMatrix) {
		ASSERT_EQ(row.size(), 2u);
		for (auto nCount : row) {
			nTotal += nCount;
		}
	}
	EXPECT_EQ(nTotal, 10);
	EXPECT_EQ(result.metrics.count("loss"), 0u);
	ASSERT_EQ(result.metrics.count("accuracy"), 1u);
	EXPECT_GE(result.metrics.at("accuracy"), 0.f);
	EXPECT_LE(result.metrics.at("accuracy"), 1.f);

	auto preds = orchestrator.Infer(false);
	EXPECT_EQ(preds.size(), 7u);
}

TEST_F(OrchestratorTest, RegressionTestReportsLoss) {
	auto conf = MakeRnnConfig(m_Tmp.File("model.pkl"));
	conf.taskType = TaskType::REGRESS;
	conf.classLabels.clear();
	conf.lossWeight.clear();
	TrainingOrchestrator orchestrator(conf, AllLoaders(),
			CreateMetrics(nlohmann::json(), conf));
	orchestrator.Train();
	auto result = orchestrator.Test(true);
	EXPECT_EQ(result.predictions.size(), 10u);
	EXPECT_TRUE(result.confusionMatrix.empty());
	ASSERT_EQ(result.metrics.count("loss"), 1u);
	ASSERT_EQ(result.metrics.count("mae"), 1u);
	EXPECT_GE(result.metrics.at("loss"), 0.f);
}

TEST_F(OrchestratorTest, TrainNeedsValidationData) {
	auto conf = MakeRnnConfig(m_Tmp.File("model.pkl"));
	TrainingOrchestrator orchestrator(conf,
			LOADER_MAP{{Phase::TRAIN, m_pTrain.get()}},
			CreateMetrics(nlohmann::json(), conf));
	EXPECT_THROW(orchestrator.Train(), ConfigurationError);
	EXPECT_THROW(orchestrator.Test(false), ConfigurationError);
}

TEST_F(OrchestratorTest, CudaFallsBackForTrees) {
	auto conf = MakeTreeConfig(m_Tmp.File("trees.txt"));
	conf.bCuda = true;
	torch::manual_seed(3);
	auto tTrain = torch::randn({120, 4});
	auto tVal = torch::randn({60, 4});
	TensorLoader train(tTrain, (tTrain.select(1, 2) > 0).to(torch::kFloat));
	TensorLoader val(tVal, (tVal.select(1, 2) > 0).to(torch::kFloat));
	TrainingOrchestrator orchestrator(conf, LOADER_MAP{{Phase::TRAIN, &train},
			{Phase::VAL, &val}, {Phase::TEST, &val}},
			CreateMetrics(nlohmann::json(), conf));
	EXPECT_TRUE(orchestrator.Device().is_cpu());

	orchestrator.Train();
	EXPECT_EQ(orchestrator.SavedEpochs(), std::vector<uint64_t>{0});
	auto result = orchestrator.Test(true);
	EXPECT_EQ(result.predictions.size(), 60u);
	EXPECT_GT(result.metrics.at("accuracy"), 0.8f);
}

TEST_F(OrchestratorTest, CudaWithoutDeviceIsAConfigurationError) {
	if (torch::cuda::is_available()) {
		GTEST_SKIP() << "a CUDA device is present";
	}
	auto conf = MakeRnnConfig(m_Tmp.File("model.pkl"));
	conf.bCuda = true;
	EXPECT_THROW({
		TrainingOrchestrator orchestrator(conf, AllLoaders(),
				CreateMetrics(nlohmann::json(), conf));
	}, ConfigurationError);
}

TEST_F(OrchestratorTest, JsonLinesLogAppendsOneObjectPerPhase) {
	auto conf = MakeRnnConfig(m_Tmp.File("model.pkl"));
	const std::string strLog = m_Tmp.File("logs/metrics.jsonl");
	{
		JsonLinesLogger logger(strLog);
		TrainingOrchestrator orchestrator(conf, AllLoaders(),
				CreateMetrics(nlohmann::json(), conf), &logger);
		orchestrator.Train();
	}
	std::ifstream logFile(strLog);
	ASSERT_TRUE(logFile.is_open());
	std::vector<nlohmann::json> lines;
	for (std::string strLine; std::getline(logFile, strLine); ) {
		lines.push_back(nlohmann::json::parse(strLine));
	}
	// two epochs of train and val
	ASSERT_EQ(lines.size(), 4u);
	EXPECT_EQ(lines[0]["epoch"].get<uint64_t>(), 0u);
	EXPECT_EQ(lines[3]["epoch"].get<uint64_t>(), 1u);
	EXPECT_TRUE(lines[0].contains("train_loss"));
	EXPECT_TRUE(lines[0].contains("train_accuracy"));
	EXPECT_FALSE(lines[0].contains("val_loss"));
	EXPECT_TRUE(lines[1].contains("val_loss"));
	EXPECT_TRUE(lines[1].contains("val_accuracy"));

	// a second logger on the same file appends
	JsonLinesLogger again(strLog);
	again.Update(9, NAMED_VALUES{{"val_loss", 0.25f}});
	logFile.close();
	logFile.open(strLog);
	std::string strLast;
	uint64_t nLines = 0;
	for (std::string strLine; std::getline(logFile, strLine); ++nLines) {
		strLast = strLine;
	}
	EXPECT_EQ(nLines, 5u);
	auto jLast = nlohmann::json::parse(strLast);
	EXPECT_EQ(jLast["epoch"].get<uint64_t>(), 9u);
	EXPECT_FLOAT_EQ(jLast["val_loss"].get<float>(), 0.25f);
}
