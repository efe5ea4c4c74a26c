#include <cmath>
#include <fstream>
#include <limits>
#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include "../src/errors.hpp"
#include "../src/weights.hpp"
#include "../src/backends/model_backend.hpp"
#include "test_utils.hpp"

namespace {

INPUT_SHAPE SequenceShape() {
	INPUT_SHAPE shape;
	shape.nFeatureSize = 3;
	shape.nSeqLen = 2;
	return shape;
}

INPUT_SHAPE TableShape(uint64_t nFeatures) {
	INPUT_SHAPE shape;
	shape.nFeatureSize = nFeatures;
	return shape;
}

} // namespace

TEST(ModelBackend, ClassWeightMismatchFailsAtConstruction) {
	TempDir tmp;
	auto conf = MakeRnnConfig(tmp.File("model.pkl"));
	conf.lossWeight = {1.f, 1.f, 1.f};
	EXPECT_THROW({
		ModelBackend backend(conf, SequenceShape(), SEED_CONTEXT{1});
	}, ConfigurationError);

	conf = MakeTreeConfig(tmp.File("model.txt"));
	conf.lossWeight = {1.f};
	EXPECT_THROW({
		ModelBackend backend(conf, TableShape(4), SEED_CONTEXT{1});
	}, ConfigurationError);
}

TEST(ModelBackend, UnfittedModelRefusesPredictAndSave) {
	TempDir tmp;
	ModelBackend backend(MakeRnnConfig(tmp.File("model.pkl")),
			SequenceShape(), SEED_CONTEXT{1});
	EXPECT_FALSE(backend.IsFitted());
	EXPECT_THROW(backend.Predict(torch::rand({2, 3, 2})), ModelNotFittedError);
	EXPECT_THROW(backend.SaveModel(), ModelNotFittedError);
	EXPECT_FALSE(boost::filesystem::exists(tmp.File("model.pkl")));
}

TEST(ModelBackend, MissingCheckpoint) {
	TempDir tmp;
	ModelBackend backend(MakeRnnConfig(tmp.File("absent.pkl")),
			SequenceShape(), SEED_CONTEXT{1});
	EXPECT_THROW(backend.LoadModel(), CheckpointLoadError);
	EXPECT_FALSE(backend.IsFitted());

	ModelBackend trees(MakeTreeConfig(tmp.File("absent.txt")),
			TableShape(4), SEED_CONTEXT{1});
	EXPECT_THROW(trees.LoadModel(), CheckpointLoadError);
}

TEST(GradientModel, FitReturnsLossAndPredictionsPerBatch) {
	TempDir tmp;
	ModelBackend backend(MakeRnnConfig(tmp.File("model.pkl")),
			SequenceShape(), SEED_CONTEXT{1});
	EXPECT_EQ(backend.Kind(), ModelKind::GRADIENT);
	EXPECT_TRUE(backend.SupportsAccelerator());

	torch::manual_seed(0);
	auto tInputs = torch::rand({6, 3, 2});
	auto tLabels = torch::tensor({0.f, 1.f, 0.f, 1.f, 1.f, 0.f});
	float fFirstLR = backend.AsGradient()->LearningRate();
	for (int i = 0; i < 3; ++i) {
		auto result = backend.Fit(tInputs, tLabels, Phase::TRAIN);
		EXPECT_TRUE(std::isfinite(result.fLoss));
		ASSERT_EQ(result.tPreds.size(0), 6);
		EXPECT_EQ(result.tPreds.scalar_type(), torch::kLong);
	}
	EXPECT_TRUE(backend.IsFitted());

	backend.AnnealLR(2.f);
	EXPECT_FLOAT_EQ(backend.AsGradient()->LearningRate(), fFirstLR / 2);

	auto tPreds = backend.Predict(tInputs);
	EXPECT_EQ(tPreds.size(0), 6);
	auto tMin = tPreds.min().item<int64_t>();
	auto tMax = tPreds.max().item<int64_t>();
	EXPECT_GE(tMin, 0);
	EXPECT_LE(tMax, 1);
}

TEST(GradientModel, SavedWeightsReloadIntoFreshModel) {
	TempDir tmp;
	auto conf = MakeRnnConfig(tmp.File("ckpt/model.pkl"));
	auto tInputs = torch::rand({5, 3, 2});
	auto tLabels = torch::tensor({0.f, 1.f, 1.f, 0.f, 1.f});

	ModelBackend trained(conf, SequenceShape(), SEED_CONTEXT{1});
	trained.Fit(tInputs, tLabels, Phase::TRAIN);
	trained.SaveModel();
	ASSERT_TRUE(boost::filesystem::exists(conf.strModelPath));

	ModelBackend reloaded(conf, SequenceShape(), SEED_CONTEXT{2});
	reloaded.LoadModel();
	EXPECT_TRUE(reloaded.IsFitted());
	auto lhs = trained.Evaluate(tInputs, tLabels);
	auto rhs = reloaded.Evaluate(tInputs, tLabels);
	EXPECT_NEAR(lhs.fLoss, rhs.fLoss, 1e-5);
	EXPECT_TRUE(torch::equal(lhs.tPreds, rhs.tPreds));
}

TEST(GradientModel, CheckpointOfAnotherShapeIsRejected) {
	TempDir tmp;
	auto conf = MakeRnnConfig(tmp.File("model.pkl"));
	ModelBackend trained(conf, SequenceShape(), SEED_CONTEXT{1});
	trained.Fit(torch::rand({4, 3, 2}), torch::tensor({0.f, 1.f, 1.f, 0.f}),
			Phase::TRAIN);
	trained.SaveModel();

	conf.gradient.nHiddenSize = 16;
	ModelBackend wider(conf, SequenceShape(), SEED_CONTEXT{1});
	EXPECT_THROW(wider.LoadModel(), CheckpointLoadError);
	EXPECT_FALSE(wider.IsFitted());
}

TEST(GradientModel, UndecodableWeightIsACheckpointError) {
	TempDir tmp;
	const std::string strFile = tmp.File("broken.pkl");
	{
		std::ofstream outFile(strFile, std::ios::binary);
		const std::string strName = "head.weight";
		const std::string strBlob(64, '\x7f');
		uint64_t nLen = strName.size();
		outFile.write((const char*)&nLen, sizeof(nLen));
		outFile.write(strName.data(), nLen);
		nLen = strBlob.size();
		outFile.write((const char*)&nLen, sizeof(nLen));
		outFile.write(strBlob.data(), nLen);
	}
	EXPECT_THROW(LoadWeights(strFile), CheckpointLoadError);

	ModelBackend backend(MakeRnnConfig(strFile), SequenceShape(),
			SEED_CONTEXT{1});
	EXPECT_THROW(backend.LoadModel(), CheckpointLoadError);
}

TEST(GradientModel, SameSeedSameInitialLoss) {
	TempDir tmp;
	auto conf = MakeRnnConfig(tmp.File("model.pkl"));
	auto tInputs = torch::rand({4, 3, 2});
	auto tLabels = torch::tensor({0.f, 1.f, 1.f, 0.f});
	ModelBackend first(conf, SequenceShape(), SEED_CONTEXT{11});
	ModelBackend second(conf, SequenceShape(), SEED_CONTEXT{11});
	EXPECT_FLOAT_EQ(first.Evaluate(tInputs, tLabels).fLoss,
			second.Evaluate(tInputs, tLabels).fLoss);
}

TEST(GradientModel, RegressionPredictsOneValuePerRow) {
	TempDir tmp;
	auto conf = MakeRnnConfig(tmp.File("model.pkl"));
	conf.taskType = TaskType::REGRESS;
	conf.classLabels.clear();
	conf.lossWeight.clear();
	ModelBackend backend(conf, SequenceShape(), SEED_CONTEXT{1});
	auto result = backend.Fit(torch::rand({3, 3, 2}),
			torch::tensor({0.5f, 1.5f, -1.f}), Phase::TRAIN);
	EXPECT_EQ(result.tPreds.dim(), 1);
	EXPECT_EQ(result.tPreds.size(0), 3);
	EXPECT_EQ(result.tPreds.scalar_type(), torch::kFloat);
}

TEST(BatchFitModel, HeldOutDataStopsEarly) {
	TempDir tmp;
	auto conf = MakeTreeConfig(tmp.File("trees/model.txt"));
	ModelBackend backend(conf, TableShape(4), SEED_CONTEXT{5});
	EXPECT_EQ(backend.Kind(), ModelKind::BATCH_FIT);
	EXPECT_FALSE(backend.SupportsAccelerator());
	EXPECT_THROW(backend.Fit(torch::rand({4, 4}), torch::zeros({4}),
			Phase::TRAIN), UnitrainError);

	torch::manual_seed(0);
	auto tInputs = torch::randn({200, 4});
	auto tLabels = (tInputs.select(1, 0) > 0).to(torch::kFloat);
	// held-out labels disagree with the training rule, so the held-out
	// loss gets worse from the first round on
	auto tHeldInputs = torch::randn({100, 4});
	auto tHeldLabels = (tHeldInputs.select(1, 0) <= 0).to(torch::kFloat);

	float fScore = backend.FitAll(tInputs, tLabels, tHeldInputs, tHeldLabels);
	EXPECT_TRUE(std::isfinite(fScore));
	EXPECT_TRUE(backend.IsFitted());
	auto pTrees = backend.AsBatchFit();
	ASSERT_NE(pTrees, nullptr);
	EXPECT_TRUE(pTrees->StoppedEarly());
	EXPECT_LT(pTrees->NumIterations(), (int)conf.batchFit.nEstimators);

	auto result = backend.Evaluate(tInputs, tLabels);
	EXPECT_EQ(result.tPreds.size(0), 200);
	EXPECT_TRUE(std::isfinite(result.fLoss));
}

TEST(BatchFitModel, LearnsAndReloads) {
	TempDir tmp;
	auto conf = MakeTreeConfig(tmp.File("trees/model.txt"));
	conf.batchFit.bEarlyStopping = false;
	conf.batchFit.nEstimators = 30;
	torch::manual_seed(1);
	auto tInputs = torch::randn({300, 4});
	auto tLabels = (tInputs.select(1, 1) > 0).to(torch::kFloat);

	ModelBackend backend(conf, TableShape(4), SEED_CONTEXT{5});
	backend.FitAll(tInputs, tLabels, torch::Tensor(), torch::Tensor());
	EXPECT_FALSE(backend.AsBatchFit()->StoppedEarly());
	auto tPreds = backend.Predict(tInputs).to(torch::kFloat);
	float fAccuracy = tPreds.eq(tLabels).to(torch::kFloat).mean().item<float>();
	EXPECT_GT(fAccuracy, 0.9f);

	backend.SaveModel();
	ModelBackend reloaded(conf, TableShape(4), SEED_CONTEXT{5});
	reloaded.LoadModel();
	EXPECT_TRUE(torch::equal(reloaded.Predict(tInputs), backend.Predict(tInputs)));

	ModelBackend wider(conf, TableShape(6), SEED_CONTEXT{5});
	EXPECT_THROW(wider.LoadModel(), CheckpointLoadError);
}

TEST(BatchFitModel, MulticlassRandomForest) {
	TempDir tmp;
	auto conf = MakeTreeConfig(tmp.File("rf.txt"));
	conf.strModelType = "random_forest";
	conf.classLabels = {"a", "b", "c"};
	conf.lossWeight = {1.f, 1.f, 2.f};
	conf.batchFit.nEstimators = 20;
	conf.batchFit.bEarlyStopping = false;
	torch::manual_seed(2);
	auto tInputs = torch::randn({150, 3});
	auto tLabels = tInputs.select(1, 0).gt(0).to(torch::kFloat)
			+ tInputs.select(1, 1).gt(0.5).to(torch::kFloat);

	ModelBackend backend(conf, TableShape(3), SEED_CONTEXT{5});
	backend.FitAll(tInputs, tLabels, torch::Tensor(), torch::Tensor());
	auto tScores = backend.AsBatchFit()->PredictScores(tInputs);
	ASSERT_EQ(tScores.size(1), 3);
	EXPECT_TRUE(torch::allclose(tScores.sum(1), torch::ones({150}), 1e-4, 1e-4));
}

TEST(BatchFitModel, SequenceInputsUseEveryColumn) {
	TempDir tmp;
	auto conf = MakeTreeConfig(tmp.File("seq.txt"));
	conf.batchFit.bEarlyStopping = false;
	conf.batchFit.nEstimators = 10;
	ModelBackend backend(conf, SequenceShape(), SEED_CONTEXT{5});
	ASSERT_NE(backend.AsBatchFit(), nullptr);
	EXPECT_EQ(backend.AsBatchFit()->NumFeatures(), 6u);

	torch::manual_seed(4);
	auto tInputs = torch::randn({80, 3, 2});
	auto tLabels = (tInputs.select(1, 2).select(1, 1) > 0).to(torch::kFloat);
	backend.FitAll(tInputs, tLabels, torch::Tensor(), torch::Tensor());
	EXPECT_EQ(backend.Predict(tInputs).size(0), 80);

	EXPECT_THROW(backend.Predict(torch::randn({4, 5})), ConfigurationError);

	INPUT_SHAPE imageShape;
	imageShape.nChannels = 1;
	imageShape.nImageHeight = 2;
	imageShape.nImageWidth = 3;
	imageShape.nFeatureSize = 6;
	ModelBackend images(conf, imageShape, SEED_CONTEXT{5});
	EXPECT_EQ(images.AsBatchFit()->NumFeatures(), 6u);
}

TEST(BatchFitModel, FeatureImportanceFavoursInformativeColumn) {
	TempDir tmp;
	auto conf = MakeTreeConfig(tmp.File("trees.txt"));
	conf.batchFit.bEarlyStopping = false;
	conf.batchFit.nEstimators = 20;
	ModelBackend backend(conf, TableShape(4), SEED_CONTEXT{5});
	EXPECT_THROW(backend.AsBatchFit()->FeatureImportance(), ModelNotFittedError);

	torch::manual_seed(6);
	auto tInputs = torch::randn({300, 4});
	auto tLabels = (tInputs.select(1, 2) > 0).to(torch::kFloat);
	backend.FitAll(tInputs, tLabels, torch::Tensor(), torch::Tensor());

	for (bool bGain : {false, true}) {
		auto importance = backend.AsBatchFit()->FeatureImportance(bGain);
		ASSERT_EQ(importance.size(), 4u);
		for (uint64_t i = 0; i < importance.size(); ++i) {
			if (i != 2) {
				EXPECT_GT(importance[2], importance[i]) << "column " << i;
			}
		}
	}
}

TEST(BatchFitModel, RowCountBeyondInt32IsRejected) {
	TempDir tmp;
	ModelBackend backend(MakeTreeConfig(tmp.File("trees.txt")), TableShape(4),
			SEED_CONTEXT{5});
	// a broadcast view, no memory is allocated for the rows
	const int64_t nRows = (int64_t)std::numeric_limits<int32_t>::max() + 1;
	auto tHuge = torch::zeros({1, 4}).expand({nRows, 4});
	EXPECT_THROW(backend.FitAll(tHuge, torch::zeros({1}), torch::Tensor(),
			torch::Tensor()), BackendError);
	EXPECT_FALSE(backend.IsFitted());
}
