#include <algorithm>
#include <gtest/gtest.h>
#include "../src/argman.hpp"
#include "../src/config.hpp"
#include "../src/errors.hpp"

namespace {

nlohmann::json MakeRnnJson() {
	return nlohmann::json::parse(R"({
		"task_type": "classify",
		"class_labels": ["a", "b", "c"],
		"loss_weight": [1.0, 2.0, 1.0],
		"model_type": "rnn",
		"model_path": "/tmp/unitrain/model.pkl",
		"epochs": 3,
		"batch_size": 16,
		"seed": 42,
		"cuda": false,
		"learning_anneal": 1.1,
		"silent": true,
		"rnn_hidden_size": 32,
		"rnn_n_layers": 2,
		"bidirectional": true,
		"batch_norm": false,
		"optimizer": "sgd",
		"lr": 0.01
	})");
}

bool Contains(const std::vector<std::string> &keys, const std::string &strKey) {
	return std::find(keys.begin(), keys.end(), strKey) != keys.end();
}

} // namespace

TEST(RunConfig, ParsesTypedFields) {
	auto conf = ParseRunConfig(MakeRnnJson());
	EXPECT_EQ(conf.taskType, TaskType::CLASSIFY);
	EXPECT_EQ(conf.Kind(), ModelKind::GRADIENT);
	EXPECT_EQ(conf.classLabels.size(), 3u);
	EXPECT_FLOAT_EQ(conf.lossWeight[1], 2.f);
	EXPECT_EQ(conf.nEpochs, 3u);
	EXPECT_EQ(conf.nBatchSize, 16u);
	EXPECT_EQ(conf.nSeed, 42u);
	EXPECT_EQ(conf.gradient.nHiddenSize, 32u);
	EXPECT_EQ(conf.gradient.nLayers, 2u);
	EXPECT_FALSE(conf.gradient.bBatchNorm);
	EXPECT_EQ(conf.gradient.optimizer.strName, "sgd");
	EXPECT_FLOAT_EQ(conf.gradient.optimizer.fLearningRate, 0.01f);
	EXPECT_FLOAT_EQ(conf.fLearningAnneal, 1.1f);
}

TEST(RunConfig, ReportsEveryMissingKeyAtOnce) {
	auto jConf = MakeRnnJson();
	jConf.erase("epochs");
	jConf.erase("seed");
	jConf.erase("loss_weight");
	jConf.erase("rnn_hidden_size");
	try {
		ParseRunConfig(jConf);
		FAIL() << "missing keys accepted";
	} catch (const ConfigurationError &e) {
		const auto &missing = e.MissingKeys();
		EXPECT_EQ(missing.size(), 4u);
		EXPECT_TRUE(Contains(missing, "epochs"));
		EXPECT_TRUE(Contains(missing, "seed"));
		EXPECT_TRUE(Contains(missing, "loss_weight"));
		EXPECT_TRUE(Contains(missing, "rnn_hidden_size"));
	}
}

TEST(RunConfig, RegressNeedsNoClassKeys) {
	auto jConf = MakeRnnJson();
	jConf["task_type"] = "regress";
	jConf.erase("class_labels");
	jConf.erase("loss_weight");
	auto conf = ParseRunConfig(jConf);
	EXPECT_EQ(conf.taskType, TaskType::REGRESS);
	EXPECT_TRUE(conf.classLabels.empty());
}

TEST(RunConfig, ClassNamesAlias) {
	auto jConf = MakeRnnJson();
	jConf["class_names"] = jConf["class_labels"];
	jConf.erase("class_labels");
	auto conf = ParseRunConfig(jConf);
	EXPECT_EQ(conf.classLabels[2], "c");
}

TEST(RunConfig, BatchFitKeys) {
	auto jConf = MakeRnnJson();
	jConf["model_type"] = "lightgbm";
	try {
		ParseRunConfig(jConf);
		FAIL() << "missing tree keys accepted";
	} catch (const ConfigurationError &e) {
		EXPECT_EQ(e.MissingKeys().size(), 4u);
		EXPECT_TRUE(Contains(e.MissingKeys(), "n_estimators"));
		EXPECT_TRUE(Contains(e.MissingKeys(), "reg_lambda"));
	}
	jConf["n_estimators"] = 50;
	jConf["max_depth"] = 4;
	jConf["reg_alpha"] = 0.1;
	jConf["reg_lambda"] = 0.2;
	jConf["early_stopping"] = false;
	auto conf = ParseRunConfig(jConf);
	EXPECT_EQ(conf.Kind(), ModelKind::BATCH_FIT);
	EXPECT_EQ(conf.batchFit.nEstimators, 50u);
	EXPECT_EQ(conf.batchFit.nMaxDepth, 4);
	EXPECT_FALSE(conf.batchFit.bEarlyStopping);
}

TEST(RunConfig, RejectsBadValues) {
	auto jConf = MakeRnnJson();
	jConf["model_type"] = "svm";
	EXPECT_THROW(ParseRunConfig(jConf), ConfigurationError);

	jConf = MakeRnnJson();
	jConf["task_type"] = "cluster";
	EXPECT_THROW(ParseRunConfig(jConf), ConfigurationError);

	jConf = MakeRnnJson();
	jConf["epochs"] = "three";
	EXPECT_THROW(ParseRunConfig(jConf), ConfigurationError);
}

TEST(ArgMan, TracksWhetherAKeyWasGiven) {
	ArgMan argMan;
	Arg<std::string> argName("name", "", argMan);
	Arg<uint64_t> argCount("count", 5, argMan);
	ParseArgsFromJson(nlohmann::json{{"count", 2}}, argMan);
	EXPECT_FALSE(argName.IsSet());
	EXPECT_TRUE(argCount.IsSet());
	EXPECT_EQ(argCount(), 2u);

	argName.Set("run");
	EXPECT_TRUE(argName.IsSet());
	EXPECT_EQ(argName(), "run");
}
