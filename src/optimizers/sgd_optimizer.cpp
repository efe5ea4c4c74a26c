#include "../creator.hpp"
#include "basic_optimizer.hpp"

class SGDOptimizer : public TorchOptimizer<torch::optim::SGD,
		torch::optim::SGDOptions> {
public:
	void Initialize(const OPTIMIZER_CONFIG &conf) override {
		m_Conf = conf;
	}

protected:
	torch::optim::SGDOptions _MakeOptions() const override {
		return torch::optim::SGDOptions(m_Conf.fLearningRate)
			.weight_decay(m_Conf.fWeightDecay)
			.momentum(m_Conf.fMomentum);
	}

private:
	OPTIMIZER_CONFIG m_Conf;
};

REGISTER_CREATOR_CONF(BasicOptimizer, SGDOptimizer, OPTIMIZER_CONFIG, "sgd");
