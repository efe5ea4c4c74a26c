#include "../creator.hpp"
#include "basic_optimizer.hpp"

class AdamOptimizer : public TorchOptimizer<torch::optim::Adam,
		torch::optim::AdamOptions> {
public:
	void Initialize(const OPTIMIZER_CONFIG &conf) override {
		m_Conf = conf;
	}

protected:
	torch::optim::AdamOptions _MakeOptions() const override {
		return torch::optim::AdamOptions(m_Conf.fLearningRate)
			.weight_decay(m_Conf.fWeightDecay);
	}

private:
	OPTIMIZER_CONFIG m_Conf;
};

REGISTER_CREATOR_CONF(BasicOptimizer, AdamOptimizer, OPTIMIZER_CONFIG, "adam");
