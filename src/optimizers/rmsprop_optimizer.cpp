#include "../creator.hpp"
#include "basic_optimizer.hpp"

class RMSpropOptimizer : public TorchOptimizer<torch::optim::RMSprop,
		torch::optim::RMSpropOptions> {
public:
	void Initialize(const OPTIMIZER_CONFIG &conf) override {
		m_Conf = conf;
	}

protected:
	torch::optim::RMSpropOptions _MakeOptions() const override {
		return torch::optim::RMSpropOptions(m_Conf.fLearningRate)
			.weight_decay(m_Conf.fWeightDecay)
			.momentum(m_Conf.fMomentum);
	}

private:
	OPTIMIZER_CONFIG m_Conf;
};

REGISTER_CREATOR_CONF(BasicOptimizer, RMSpropOptimizer, OPTIMIZER_CONFIG,
		"rmsprop");
