#ifndef __TEST_UTILS_HPP
#define __TEST_UTILS_HPP

#include <string>
#include <boost/filesystem.hpp>
#include "../src/config.hpp"

// Fresh directory under the system temp path, removed on destruction.
class TempDir {
public:
	TempDir() {
		m_Path = boost::filesystem::temp_directory_path()
				/ boost::filesystem::unique_path("unitrain-%%%%-%%%%-%%%%");
		boost::filesystem::create_directories(m_Path);
	}
	~TempDir() {
		boost::system::error_code ec;
		boost::filesystem::remove_all(m_Path, ec);
	}
	std::string File(const std::string &strName) const {
		return (m_Path / strName).string();
	}

private:
	boost::filesystem::path m_Path;
};

// Small single-layer GRU classifier over [N, 3, 2] inputs.
inline RUN_CONFIG MakeRnnConfig(const std::string &strModelPath) {
	RUN_CONFIG conf;
	conf.taskType = TaskType::CLASSIFY;
	conf.classLabels = {"neg", "pos"};
	conf.lossWeight = {1.f, 1.f};
	conf.strModelType = "rnn";
	conf.strModelPath = strModelPath;
	conf.nEpochs = 2;
	conf.nBatchSize = 4;
	conf.nSeed = 7;
	conf.bSilent = true;
	conf.gradient.nHiddenSize = 8;
	conf.gradient.nLayers = 1;
	conf.gradient.bBidirectional = false;
	conf.gradient.bBatchNorm = false;
	conf.gradient.optimizer.strName = "adam";
	conf.gradient.optimizer.fLearningRate = 1e-2f;
	return conf;
}

inline RUN_CONFIG MakeTreeConfig(const std::string &strModelPath) {
	RUN_CONFIG conf;
	conf.taskType = TaskType::CLASSIFY;
	conf.classLabels = {"neg", "pos"};
	conf.lossWeight = {1.f, 1.f};
	conf.strModelType = "lightgbm";
	conf.strModelPath = strModelPath;
	conf.nEpochs = 1;
	conf.nBatchSize = 64;
	conf.nSeed = 3;
	conf.bSilent = true;
	conf.batchFit.nEstimators = 200;
	conf.batchFit.nMinDataInLeaf = 5;
	conf.batchFit.nJobs = 1;
	conf.batchFit.bEarlyStopping = true;
	conf.batchFit.nEarlyStoppingRounds = 5;
	return conf;
}

#endif // #ifndef __TEST_UTILS_HPP
