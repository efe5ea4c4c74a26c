#include <glog/logging.h>
#include "tensor_loader.hpp"

INPUT_SHAPE InputShapeOf(const torch::Tensor &tData) {
	INPUT_SHAPE shape;
	switch (tData.dim()) {
	case 2:
		shape.nFeatureSize = tData.size(1);
		shape.nBatchNormSize = shape.nFeatureSize;
		break;
	case 3:
		shape.nFeatureSize = tData.size(1);
		shape.nSeqLen = tData.size(2);
		shape.nBatchNormSize = shape.nFeatureSize;
		break;
	case 4:
		shape.nChannels = tData.size(1);
		shape.nImageHeight = tData.size(2);
		shape.nImageWidth = tData.size(3);
		shape.nFeatureSize = shape.nChannels * shape.nImageHeight
				* shape.nImageWidth;
		shape.nBatchNormSize = shape.nChannels;
		break;
	default:
		LOG(FATAL) << "Unsupported input rank: " << tData.dim();
	}
	return shape;
}

TensorLoader::TensorLoader(torch::Tensor tData, torch::Tensor tTarget)
	: m_tData(std::move(tData))
	, m_tTarget(std::move(tTarget)) {
	CHECK(m_tData.defined());
	if (m_tTarget.defined()) {
		CHECK_EQ(m_tData.size(0), m_tTarget.size(0));
	}
}

TensorLoader::~TensorLoader() {
	try {
		_JoinWorker();
	} catch (const std::exception &e) {
		LOG(ERROR) << "Pending batch failed: " << e.what();
	}
}

uint64_t TensorLoader::Size() const {
	return m_tData.size(0);
}

INPUT_SHAPE TensorLoader::GetInputShape() const {
	return InputShapeOf(m_tData);
}

bool TensorLoader::HasTargets() const {
	return m_tTarget.defined();
}

void TensorLoader::_LoadBatch(const std::vector<uint64_t> &indices,
		torch::Tensor &tData, torch::Tensor &tTarget) {
	CHECK(!indices.empty());
	std::vector<int64_t> rows(indices.begin(), indices.end());
	auto tIndices = torch::tensor(rows, torch::kLong);
	tData = m_tData.index_select(0, tIndices);
	if (m_tTarget.defined()) {
		tTarget = m_tTarget.index_select(0, tIndices);
	} else {
		tTarget = torch::Tensor();
	}
}
