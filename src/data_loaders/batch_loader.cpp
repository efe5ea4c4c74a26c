#include <algorithm>
#include <numeric>
#include <glog/logging.h>

#include "../argman.hpp"
#include "batch_loader.hpp"

BatchLoader::~BatchLoader() {
	if (m_Worker.joinable()) {
		m_Worker.join();
	}
}

void BatchLoader::Initialize(const nlohmann::json &jConf) {
	ArgMan argMan;
	Arg<bool> argShuffle("shuffle", false, argMan);
	ParseArgsFromJson(jConf, argMan);
	m_bShuffle = argShuffle();
}

bool BatchLoader::HasTargets() const {
	return true;
}

uint64_t BatchLoader::NumBatches(uint64_t nBatchSize) const {
	CHECK_GT(nBatchSize, 0);
	return (Size() + nBatchSize - 1) / nBatchSize;
}

void BatchLoader::SetShuffle(bool bShuffle) {
	m_bShuffle = bShuffle;
}

void BatchLoader::SetSeed(const SEED_CONTEXT &seedCtx) {
	_JoinWorker();
	m_RG = seedCtx.MakeGenerator();
}

void BatchLoader::_JoinWorker() {
	if (m_Worker.joinable()) {
		m_Worker.join();
	}
	if (m_pWorkerError) {
		auto pError = m_pWorkerError;
		m_pWorkerError = nullptr;
		m_bPrefetched = false;
		std::rethrow_exception(pError);
	}
}

void BatchLoader::ResetCursor() {
	_JoinWorker();
	m_bPrefetched = false;
	if (m_Indices.size() != Size()) {
		m_Indices.resize(Size());
		std::iota(m_Indices.begin(), m_Indices.end(), 0);
	}
	if (m_bShuffle) {
		std::shuffle(m_Indices.begin(), m_Indices.end(), m_RG);
	}
	m_nCursor = 0;
}

bool BatchLoader::GetBatch(uint64_t nBatchSize, torch::Tensor &tData,
		torch::Tensor &tTarget, torch::Device device) {
	CHECK_GT(nBatchSize, 0);
	_JoinWorker();
	if (m_Indices.size() != Size()) {
		ResetCursor();
	}
	if (m_nCursor >= Size()) {
		return false;
	}
	if (!m_bPrefetched || m_nPrefetchCursor != m_nCursor
			|| m_nPrefetchSize != nBatchSize || m_PrefetchDevice != device) {
		__LoadBatchToDevice(__GetBatchIndices(m_nCursor, nBatchSize),
				m_tLoadingData, m_tLoadingTarget, device);
	}
	m_bPrefetched = false;
	tData = std::move(m_tLoadingData);
	tTarget = std::move(m_tLoadingTarget);
	m_tLoadingData = torch::Tensor();
	m_tLoadingTarget = torch::Tensor();
	m_nCursor += nBatchSize;

	if (m_nCursor < Size()) {
		m_bPrefetched = true;
		m_nPrefetchCursor = m_nCursor;
		m_nPrefetchSize = nBatchSize;
		m_PrefetchDevice = device;
		m_Worker = std::thread(
			[this](std::vector<uint64_t> indices, torch::Device dev) {
				try {
					__LoadBatchToDevice(indices, m_tLoadingData,
							m_tLoadingTarget, dev);
				} catch (...) {
					m_pWorkerError = std::current_exception();
				}
			}, __GetBatchIndices(m_nCursor, nBatchSize), device);
	}
	return true;
}

std::vector<uint64_t> BatchLoader::__GetBatchIndices(uint64_t nCursor,
		uint64_t nBatchSize) const {
	uint64_t nEnd = std::min(nCursor + nBatchSize, (uint64_t)m_Indices.size());
	return std::vector<uint64_t>(m_Indices.begin() + nCursor,
			m_Indices.begin() + nEnd);
}

void BatchLoader::__LoadBatchToDevice(const std::vector<uint64_t> &indices,
		torch::Tensor &tData, torch::Tensor &tTarget, torch::Device device) {
	_LoadBatch(indices, tData, tTarget);
	if (tData.device() != device) {
		tData = tData.to(device);
	}
	if (tTarget.defined() && tTarget.device() != device) {
		tTarget = tTarget.to(device);
	}
}
