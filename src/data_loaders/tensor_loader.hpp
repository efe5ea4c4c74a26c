#ifndef __TENSOR_LOADER_HPP
#define __TENSOR_LOADER_HPP

#include "batch_loader.hpp"

// Serves batches out of tensors already in memory. Row i of tData pairs
// with row i of tTarget; an undefined tTarget makes an unlabeled source.
class TensorLoader final : public BatchLoader {
public:
	TensorLoader(torch::Tensor tData, torch::Tensor tTarget);
	~TensorLoader() override;

	uint64_t Size() const override;
	INPUT_SHAPE GetInputShape() const override;
	bool HasTargets() const override;

protected:
	void _LoadBatch(const std::vector<uint64_t> &indices,
			torch::Tensor &tData, torch::Tensor &tTarget) override;

private:
	torch::Tensor m_tData;
	torch::Tensor m_tTarget;
};

// Shape metadata of a [N, F], [N, F, T] or [N, C, H, W] input tensor.
INPUT_SHAPE InputShapeOf(const torch::Tensor &tData);

#endif // #ifndef __TENSOR_LOADER_HPP
