#ifndef __BASIC_OPTIMIZER_HPP
#define __BASIC_OPTIMIZER_HPP

#include <memory>
#include <glog/logging.h>
#include "../config.hpp"
#include "../models/basic_model.hpp"

class BasicOptimizer {
public:
	virtual ~BasicOptimizer() = default;
	virtual void Initialize(const OPTIMIZER_CONFIG &conf) = 0;
	virtual void SetModel(BasicModel &model) = 0;
	virtual void ZeroGrad() = 0;
	virtual void IterStep() = 0;
	// Divides the learning rate of every parameter group by fFactor.
	virtual void AnnealLR(float fFactor) = 0;
	virtual float GetLR() const = 0;
};

// Shared plumbing of the libtorch optimizers; _OPTIONS is the option type
// stored in each parameter group of _OPTIM.
template<typename _OPTIM, typename _OPTIONS>
class TorchOptimizer : public BasicOptimizer {
public:
	void SetModel(BasicModel &model) override {
		std::vector<torch::Tensor> params;
		for (const auto &param : model.NamedParameters()) {
			params.emplace_back(param.second);
		}
		m_pOptim.reset(new _OPTIM(params, _MakeOptions()));
	}

	void ZeroGrad() override {
		m_pOptim->zero_grad();
	}

	void IterStep() override {
		m_pOptim->step();
	}

	void AnnealLR(float fFactor) override {
		for (auto &group : m_pOptim->param_groups()) {
			auto &options = static_cast<_OPTIONS&>(group.options());
			options.lr(options.lr() / fFactor);
		}
	}

	float GetLR() const override {
		const auto &groups = m_pOptim->param_groups();
		CHECK(!groups.empty());
		return static_cast<const _OPTIONS&>(groups.front().options()).lr();
	}

protected:
	virtual _OPTIONS _MakeOptions() const = 0;

private:
	std::unique_ptr<_OPTIM> m_pOptim;
};

#endif // #ifndef __BASIC_OPTIMIZER_HPP
