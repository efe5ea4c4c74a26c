#ifndef __TYPES_HPP
#define __TYPES_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <torch/torch.h>

using TENSOR_ARY = std::vector<torch::Tensor>;
using NAMED_PARAMS = std::map<std::string, torch::Tensor>;
using NAMED_VALUES = std::map<std::string, float>;
using WEIGHT_INIT_PROC = std::function<bool(const std::string&,
		NAMED_PARAMS&, NAMED_PARAMS&)>;

enum class Phase {
	TRAIN, VAL, TEST, INFER
};

enum class TaskType {
	CLASSIFY, REGRESS
};

const std::string& PhaseName(Phase phase);

const std::string& TaskTypeName(TaskType taskType);

// Sizing metadata a data source reports once, used to shape the networks.
struct INPUT_SHAPE {
	uint64_t nFeatureSize = 0;
	uint64_t nSeqLen = 0;
	uint64_t nBatchNormSize = 0;
	uint64_t nImageHeight = 0;
	uint64_t nImageWidth = 0;
	uint64_t nChannels = 0;
};

#endif // #ifndef __TYPES_HPP
