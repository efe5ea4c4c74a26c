#ifndef __BATCH_LOADER_HPP
#define __BATCH_LOADER_HPP

#include <exception>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <torch/torch.h>
#include <nlohmann/json.hpp>
#include "../types.hpp"
#include "../utils.hpp"

// Source of (inputs, targets) batches for one phase. Batches come out in
// cursor order; the final batch of a pass may be shorter than the requested
// size. The next batch is prepared on one background worker while the
// current one is in use.
class BatchLoader {
public:
	BatchLoader() = default;
	virtual ~BatchLoader();

	virtual void Initialize(const nlohmann::json &jConf);
	virtual uint64_t Size() const = 0;
	virtual INPUT_SHAPE GetInputShape() const = 0;
	virtual bool HasTargets() const;

	uint64_t NumBatches(uint64_t nBatchSize) const;
	void SetShuffle(bool bShuffle);
	void SetSeed(const SEED_CONTEXT &seedCtx);

	virtual void ResetCursor();
	// tTarget is left undefined when the source has no targets.
	virtual bool GetBatch(uint64_t nBatchSize, torch::Tensor &tData,
			torch::Tensor &tTarget, torch::Device device);

protected:
	virtual void _LoadBatch(const std::vector<uint64_t> &indices,
			torch::Tensor &tData, torch::Tensor &tTarget) = 0;
	// Derived destructors must call this before their members go away.
	void _JoinWorker();

private:
	std::vector<uint64_t> __GetBatchIndices(uint64_t nCursor,
			uint64_t nBatchSize) const;
	void __LoadBatchToDevice(const std::vector<uint64_t> &indices,
			torch::Tensor &tData, torch::Tensor &tTarget, torch::Device device);

private:
	uint64_t m_nCursor = 0;
	bool m_bShuffle = false;
	std::mt19937 m_RG;
	std::vector<uint64_t> m_Indices;
	std::thread m_Worker;
	std::exception_ptr m_pWorkerError;
	bool m_bPrefetched = false;
	uint64_t m_nPrefetchCursor = 0;
	uint64_t m_nPrefetchSize = 0;
	torch::Device m_PrefetchDevice = torch::kCPU;
	torch::Tensor m_tLoadingData;
	torch::Tensor m_tLoadingTarget;
};

#endif //__BATCH_LOADER_HPP
