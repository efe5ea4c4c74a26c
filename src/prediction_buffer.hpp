#ifndef __PREDICTION_BUFFER_HPP
#define __PREDICTION_BUFFER_HPP

#include <vector>
#include <torch/torch.h>

// Per-row values gathered batch by batch into num_batches x batch_size
// slots. A slot counts only once written, so a short final batch leaves its
// tail out of Collect().
class PredictionBuffer {
public:
	PredictionBuffer(uint64_t nBatches, uint64_t nBatchSize);

	void Write(uint64_t nBatchIdx, const torch::Tensor &tValues);

	// Written values in slot order.
	std::vector<float> Collect() const;

	uint64_t Capacity() const {
		return m_Values.size();
	}
	uint64_t NumValid() const;

private:
	uint64_t m_nBatchSize;
	std::vector<float> m_Values;
	std::vector<bool> m_Valid;
};

#endif // #ifndef __PREDICTION_BUFFER_HPP
