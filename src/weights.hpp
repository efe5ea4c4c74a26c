#ifndef __WEIGHTS_HPP
#define __WEIGHTS_HPP

#include "types.hpp"

// Checkpoint of named tensors: per tensor a length-prefixed name and a
// length-prefixed torch::pickle_save blob.
// Throws CheckpointLoadError when strFilename is absent, truncated or empty.
NAMED_PARAMS LoadWeights(const std::string &strFilename);

// Tensors are moved to the CPU first; the file appears atomically.
void SaveWeights(const NAMED_PARAMS &weights, const std::string &strFilename);

// WEIGHT_INIT_PROC for the layers the networks are built from: Linear,
// Conv2d, BatchNorm and the recurrent layers. False for anything else.
bool InitModuleWeight(const std::string &strModuleType,
		NAMED_PARAMS &weights, NAMED_PARAMS &buffers);

#endif // #ifndef __WEIGHTS_HPP
