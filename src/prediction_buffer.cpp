#include <algorithm>
#include <glog/logging.h>
#include "prediction_buffer.hpp"

PredictionBuffer::PredictionBuffer(uint64_t nBatches, uint64_t nBatchSize)
	: m_nBatchSize(nBatchSize)
	, m_Values(nBatches * nBatchSize, 0.f)
	, m_Valid(nBatches * nBatchSize, false) {
	CHECK_GT(nBatchSize, 0);
}

void PredictionBuffer::Write(uint64_t nBatchIdx, const torch::Tensor &tValues) {
	auto tFlat = tValues.reshape({-1}).to(torch::kCPU, torch::kFloat)
			.contiguous();
	uint64_t nRows = (uint64_t)tFlat.size(0);
	CHECK_LE(nRows, m_nBatchSize) << "Batch " << nBatchIdx << " too large";
	uint64_t nBeg = nBatchIdx * m_nBatchSize;
	CHECK_LE(nBeg + nRows, m_Values.size()) << "Batch " << nBatchIdx
			<< " beyond capacity";
	const float *pValues = tFlat.data_ptr<float>();
	std::copy(pValues, pValues + nRows, m_Values.begin() + nBeg);
	std::fill(m_Valid.begin() + nBeg, m_Valid.begin() + nBeg + nRows, true);
}

std::vector<float> PredictionBuffer::Collect() const {
	std::vector<float> values;
	values.reserve(NumValid());
	for (uint64_t i = 0; i < m_Values.size(); ++i) {
		if (m_Valid[i]) {
			values.push_back(m_Values[i]);
		}
	}
	return values;
}

uint64_t PredictionBuffer::NumValid() const {
	return (uint64_t)std::count(m_Valid.begin(), m_Valid.end(), true);
}
