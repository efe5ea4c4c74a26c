#include <glog/logging.h>
#include "../creator.hpp"
#include "../errors.hpp"
#include "basic_model.hpp"

// Conv -> [BatchNorm] -> ReLU -> MaxPool blocks over [batch, channel,
// height, width] input; the channel count doubles with every block.
class CNNModel : public BasicModel {
public:
	void Initialize(const NETWORK_CONFIG &conf) override {
		const GRADIENT_CONFIG &grad = conf.gradient;
		const INPUT_SHAPE &shape = conf.shape;
		if (shape.nChannels == 0 || shape.nImageHeight == 0
				|| shape.nImageWidth == 0) {
			throw ConfigurationError("cnn model needs image-shaped input");
		}
		if (grad.nConvBlocks == 0 || grad.nConvChannels == 0) {
			throw ConfigurationError("cnn_blocks and cnn_channels must be positive");
		}
		m_nChannels = shape.nChannels;
		m_nHeight = shape.nImageHeight;
		m_nWidth = shape.nImageWidth;

		m_Features = register_module("features", torch::nn::Sequential());
		int64_t nInCh = m_nChannels;
		int64_t nOutCh = grad.nConvChannels;
		int64_t nHeight = m_nHeight;
		int64_t nWidth = m_nWidth;
		for (uint64_t i = 0; i < grad.nConvBlocks; ++i) {
			m_Features->push_back(torch::nn::Conv2d(
					torch::nn::Conv2dOptions(nInCh, nOutCh, 3).padding(1)));
			if (grad.bBatchNorm) {
				m_Features->push_back(torch::nn::BatchNorm2d(nOutCh));
			}
			m_Features->push_back(torch::nn::ReLU());
			if (nHeight >= 2 && nWidth >= 2) {
				m_Features->push_back(torch::nn::MaxPool2d(
						torch::nn::MaxPool2dOptions(2)));
				nHeight /= 2;
				nWidth /= 2;
			}
			nInCh = nOutCh;
			nOutCh *= 2;
		}
		m_Linear = register_module("fc", torch::nn::Linear(
				nInCh * nHeight * nWidth, conf.nOutputSize));
	}

	torch::Tensor Forward(torch::Tensor input) override {
		CHECK_EQ(input.dim(), 4);
		CHECK_EQ(input.size(1), (int64_t)m_nChannels);
		CHECK_EQ(input.size(2), (int64_t)m_nHeight);
		CHECK_EQ(input.size(3), (int64_t)m_nWidth);
		auto x = m_Features->forward(input);
		return m_Linear(x.flatten(1));
	}

private:
	uint64_t m_nChannels = 0;
	uint64_t m_nHeight = 0;
	uint64_t m_nWidth = 0;
	torch::nn::Sequential m_Features = nullptr;
	torch::nn::Linear m_Linear = nullptr;
};

REGISTER_CREATOR_CONF(BasicModel, CNNModel, NETWORK_CONFIG, "cnn");
