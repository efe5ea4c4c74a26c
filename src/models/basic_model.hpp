#ifndef __BASIC_MODEL_HPP
#define __BASIC_MODEL_HPP

#include "../types.hpp"
#include "../config.hpp"

struct NETWORK_CONFIG {
	GRADIENT_CONFIG gradient;
	INPUT_SHAPE shape;
	uint64_t nOutputSize = 1;
};

// A gradient-trained network. Forward() returns raw scores: one logit per
// class for classification, one value per row for regression.
class BasicModel : public torch::nn::Module {
public:
	BasicModel() = default;

	virtual void Initialize(const NETWORK_CONFIG &conf) = 0;

	virtual torch::Tensor Forward(torch::Tensor input) = 0;

	virtual void TrainMode(bool bTrain = true);

	virtual void SetDevice(torch::Device device);

	virtual NAMED_PARAMS NamedParameters() const;

	virtual NAMED_PARAMS NamedBuffers() const;

	// Parameters and buffers together, as stored in a checkpoint.
	NAMED_PARAMS NamedState() const;

	// Calls InitProc on each leaf module that owns tensors.
	virtual void InitWeights(WEIGHT_INIT_PROC InitProc);

	// Copies every tensor of NamedState() from the file. Throws
	// CheckpointLoadError if the file is absent or was saved from a network
	// of another shape.
	virtual void LoadWeights(const std::string &strFilename);

	virtual void SaveWeights(const std::string &strFilename) const;
};

#endif // #ifndef __BASIC_MODEL_HPP
