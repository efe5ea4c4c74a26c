#include <fstream>
#include <string>
#include <boost/filesystem.hpp>
#include <glog/logging.h>

#include <torch/torch.h>
#include <torch/script.h>

#include "errors.hpp"
#include "utils.hpp"
#include "weights.hpp"

namespace bfs = boost::filesystem;

namespace {

// Length-prefixed blob; returns false on a truncated stream.
template<typename _IS, typename _Elem>
bool LoadBuffer(_IS &inStream, std::vector<_Elem> &buf) {
	uint64_t nBufLen = 0;
	if (!inStream.read((char*)&nBufLen, sizeof(nBufLen))) {
		return false;
	}
	if (nBufLen % sizeof(_Elem) != 0) {
		return false;
	}
	buf.resize(nBufLen / sizeof(_Elem));
	return nBufLen == 0 || (bool)inStream.read((char*)buf.data(), nBufLen);
}

template<typename _OS, typename _Elem>
void SaveBuffer(_OS &outStream, const std::vector<_Elem> &buf) {
	uint64_t nBufLen = buf.size() * sizeof(_Elem);
	outStream.write((char*)&nBufLen, sizeof(nBufLen));
	if (nBufLen > 0) {
		outStream.write((char*)buf.data(), nBufLen);
	}
}

} // namespace

NAMED_PARAMS LoadWeights(const std::string &strFilename) {
	if (!bfs::exists(strFilename)) {
		throw CheckpointLoadError(strFilename, "file does not exist");
	}
	std::ifstream inFile(strFilename, std::ios::binary);
	if (!inFile.is_open()) {
		throw CheckpointLoadError(strFilename, "file cannot be opened");
	}
	NAMED_PARAMS namedParams;
	for (; inFile.peek() != EOF; ) {
		std::vector<char> name, buf;
		if (!LoadBuffer(inFile, name) || name.empty()
				|| !LoadBuffer(inFile, buf) || buf.empty()) {
			throw CheckpointLoadError(strFilename, "truncated weight record");
		}
		std::string strName(name.begin(), name.end());
		torch::Tensor tensor;
		try {
			tensor = torch::pickle_load(buf).toTensor();
		} catch (const c10::Error &e) {
			throw CheckpointLoadError(strFilename, "weight \"" + strName
					+ "\" cannot be decoded: " + e.what_without_backtrace());
		}
		namedParams[std::move(strName)] = std::move(tensor);
	}
	if (namedParams.empty()) {
		throw CheckpointLoadError(strFilename, "file holds no weights");
	}
	return namedParams;
}

void SaveWeights(const NAMED_PARAMS &weights, const std::string &strFilename) {
	StagedWrite(strFilename, [&](const std::string &strStaging) {
		std::ofstream outFile(strStaging, std::ios::binary);
		if (!outFile.is_open()) {
			throw UnitrainError("cannot open \"" + strStaging + "\" for writing");
		}
		for (const auto &param : weights) {
			std::vector<char> name(param.first.begin(), param.first.end());
			SaveBuffer(outFile, name);
			SaveBuffer(outFile, torch::pickle_save(param.second.cpu()));
		}
		outFile.flush();
		if (!outFile.good()) {
			throw UnitrainError("failed writing \"" + strStaging + "\"");
		}
	});
}

bool InitModuleWeight(const std::string &strModuleType,
		NAMED_PARAMS &weights, NAMED_PARAMS &buffers) {
	torch::NoGradGuard noGrad;
	auto iWeight = weights.find("weight");
	auto iBias = weights.find("bias");
	if (strModuleType.find("Conv2d") != std::string::npos
			|| strModuleType.find("Linear") != std::string::npos) {
		CHECK(iWeight != weights.end());
		torch::nn::init::xavier_normal_(iWeight->second);
		if (iBias != weights.end()) {
			torch::nn::init::zeros_(iBias->second);
		}
	} else if (strModuleType.find("BatchNorm") != std::string::npos) {
		auto iMean = buffers.find("running_mean");
		if (iMean != buffers.end()) {
			iMean->second.fill_(0);
		}
		auto iVar = buffers.find("running_var");
		if (iVar != buffers.end()) {
			iVar->second.fill_(1);
		}
		if (iWeight != weights.end()) {
			torch::nn::init::constant_(iWeight->second, 1.);
		}
		if (iBias != weights.end()) {
			torch::nn::init::constant_(iBias->second, 0.);
		}
	} else if (strModuleType.find("LSTM") != std::string::npos
			|| strModuleType.find("GRU") != std::string::npos
			|| strModuleType.find("RNN") != std::string::npos) {
		for (auto &w : weights) {
			if (w.first.compare(0, 5, "bias_") == 0) {
				torch::nn::init::constant_(w.second, 0.);
			} else {
				CHECK_EQ(w.first.compare(0, 7, "weight_"), 0) << w.first;
				torch::nn::init::xavier_normal_(w.second);
			}
		}
	} else {
		return false;
	}
	return true;
}
