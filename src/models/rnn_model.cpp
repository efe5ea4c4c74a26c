#include <glog/logging.h>
#include "../creator.hpp"
#include "../errors.hpp"
#include "basic_model.hpp"

// One recurrent layer over [time, batch, feature] input, with optional
// batch normalization applied to every time step. Bidirectional outputs are
// summed so the layer always emits nHidden features.
class BatchRNNImpl : public torch::nn::Module {
public:
	BatchRNNImpl(const std::string &strType, int64_t nInput, int64_t nHidden,
			bool bBidirectional, bool bBatchNorm)
			: m_bBidirectional(bBidirectional) {
		if (bBatchNorm) {
			m_BatchNorm = register_module("batch_norm",
					torch::nn::BatchNorm1d(nInput));
		}
		if (strType == "lstm") {
			m_LSTM = register_module("rnn", torch::nn::LSTM(
					torch::nn::LSTMOptions(nInput, nHidden)
					.bidirectional(bBidirectional)));
		} else if (strType == "gru") {
			m_GRU = register_module("rnn", torch::nn::GRU(
					torch::nn::GRUOptions(nInput, nHidden)
					.bidirectional(bBidirectional)));
		} else if (strType == "rnn") {
			m_RNN = register_module("rnn", torch::nn::RNN(
					torch::nn::RNNOptions(nInput, nHidden)
					.bidirectional(bBidirectional)));
		} else {
			throw ConfigurationError("rnn_type must be lstm, gru or rnn, got \""
					+ strType + "\"");
		}
	}

	torch::Tensor forward(torch::Tensor x) {
		int64_t nTime = x.size(0);
		int64_t nBatch = x.size(1);
		if (m_BatchNorm) {
			x = m_BatchNorm(x.reshape({nTime * nBatch, -1}))
					.reshape({nTime, nBatch, -1});
		}
		if (m_LSTM) {
			x = std::get<0>(m_LSTM(x));
		} else if (m_GRU) {
			x = std::get<0>(m_GRU(x));
		} else {
			x = std::get<0>(m_RNN(x));
		}
		if (m_bBidirectional) {
			x = x.view({nTime, nBatch, 2, -1}).sum(2);
		}
		return x;
	}

private:
	bool m_bBidirectional;
	torch::nn::BatchNorm1d m_BatchNorm = nullptr;
	torch::nn::LSTM m_LSTM = nullptr;
	torch::nn::GRU m_GRU = nullptr;
	torch::nn::RNN m_RNN = nullptr;
};

TORCH_MODULE(BatchRNN);

// Stacked recurrent layers over [batch, feature, time] input followed by a
// linear head on the flattened hidden states of every time step.
class RNNModel : public BasicModel {
public:
	void Initialize(const NETWORK_CONFIG &conf) override {
		const GRADIENT_CONFIG &grad = conf.gradient;
		m_nSeqLen = std::max<uint64_t>(conf.shape.nSeqLen, 1);
		m_nFeatureSize = conf.shape.nBatchNormSize > 0
				? conf.shape.nBatchNormSize : conf.shape.nFeatureSize;
		if (m_nFeatureSize == 0) {
			throw ConfigurationError("rnn model needs a positive feature size");
		}
		CHECK_GT(grad.nHiddenSize, 0);
		CHECK_GT(grad.nLayers, 0);

		m_Layers = register_module("rnns", torch::nn::ModuleList());
		int64_t nInput = m_nFeatureSize;
		for (uint64_t i = 0; i < grad.nLayers; ++i) {
			m_Layers->push_back(BatchRNN(grad.strRNNType, nInput,
					grad.nHiddenSize, grad.bBidirectional, grad.bBatchNorm));
			nInput = grad.nHiddenSize;
		}
		m_Linear = register_module("fc", torch::nn::Linear(
				torch::nn::LinearOptions(grad.nHiddenSize * m_nSeqLen,
				conf.nOutputSize).bias(false)));
	}

	torch::Tensor Forward(torch::Tensor input) override {
		if (input.dim() == 2) {
			input = input.unsqueeze(2);
		}
		CHECK_EQ(input.dim(), 3);
		CHECK_EQ(input.size(1), (int64_t)m_nFeatureSize);
		CHECK_EQ(input.size(2), (int64_t)m_nSeqLen);
		int64_t nBatch = input.size(0);
		// batch x feature x time -> time x batch x feature
		auto x = input.permute({2, 0, 1}).contiguous();
		for (const auto &layer : *m_Layers) {
			x = layer->as<BatchRNN>()->forward(x);
		}
		x = x.transpose(0, 1).reshape({nBatch, -1});
		return m_Linear(x);
	}

private:
	uint64_t m_nSeqLen = 0;
	uint64_t m_nFeatureSize = 0;
	torch::nn::ModuleList m_Layers = nullptr;
	torch::nn::Linear m_Linear = nullptr;
};

REGISTER_CREATOR_CONF(BasicModel, RNNModel, NETWORK_CONFIG, "rnn");
