#include <glog/logging.h>
#include "../errors.hpp"
#include "../weights.hpp"
#include "basic_model.hpp"

namespace {

template<typename _ITEMS>
void CollectNamed(const _ITEMS &items, NAMED_PARAMS &named) {
	for (const auto &item : items) {
		named[item.key()] = item.value();
	}
}

} // namespace

void BasicModel::TrainMode(bool bTrain) {
	train(bTrain);
}

void BasicModel::SetDevice(torch::Device device) {
	to(device);
}

NAMED_PARAMS BasicModel::NamedParameters() const {
	NAMED_PARAMS namedParams;
	CollectNamed(named_parameters(), namedParams);
	return namedParams;
}

NAMED_PARAMS BasicModel::NamedBuffers() const {
	NAMED_PARAMS namedBufs;
	CollectNamed(named_buffers(), namedBufs);
	return namedBufs;
}

NAMED_PARAMS BasicModel::NamedState() const {
	NAMED_PARAMS state = NamedParameters();
	CollectNamed(named_buffers(), state);
	return state;
}

void BasicModel::InitWeights(WEIGHT_INIT_PROC InitProc) {
	uint64_t nSkipped = 0;
	for (const auto &pSubMod : modules(false)) {
		if (!pSubMod->children().empty()) {
			continue;
		}
		NAMED_PARAMS params, buffers;
		CollectNamed(pSubMod->named_parameters(false), params);
		CollectNamed(pSubMod->named_buffers(false), buffers);
		if (params.empty() && buffers.empty()) {
			continue;
		}
		if (!InitProc(pSubMod->name(), params, buffers)) {
			LOG(WARNING) << "No initializer for " << pSubMod->name()
					<< ", keeping libtorch defaults";
			++nSkipped;
		}
	}
	VLOG(1) << nSkipped << " modules left with default initialization";
}

void BasicModel::LoadWeights(const std::string &strFilename) {
	auto loaded = ::LoadWeights(strFilename);
	auto state = NamedState();
	if (loaded.size() != state.size()) {
		throw CheckpointLoadError(strFilename, "holds " + std::to_string(
				loaded.size()) + " tensors, the network has "
				+ std::to_string(state.size()));
	}
	torch::NoGradGuard noGrad;
	for (auto &named : state) {
		auto iLoaded = loaded.find(named.first);
		if (iLoaded == loaded.end()) {
			throw CheckpointLoadError(strFilename, "no weights for \""
					+ named.first + "\"");
		}
		if (!iLoaded->second.sizes().equals(named.second.sizes())) {
			throw CheckpointLoadError(strFilename, "shape mismatch for \""
					+ named.first + "\"");
		}
		named.second.copy_(iLoaded->second);
	}
}

void BasicModel::SaveWeights(const std::string &strFilename) const {
	::SaveWeights(NamedState(), strFilename);
}
