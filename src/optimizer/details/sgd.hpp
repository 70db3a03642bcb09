#ifndef TESSEL_SGD_HPP
#define TESSEL_SGD_HPP

#include <torch/torch.h>

#include "../../common/error.hpp"

namespace Tessel::Optimizer::Details {

    struct SGDOptions {
        double learning_rate{1e-2};
        double momentum{0.0};
        double dampening{0.0};
        double weight_decay{0.0};
        bool nesterov{false};
    };

    struct SGDDescriptor {
        SGDOptions options{};
    };

    inline torch::optim::SGDOptions to_torch_options(const SGDOptions& options) {
        if (options.learning_rate <= 0.0) {
            throw ::Tessel::ConfigurationError("SGD learning rate must be positive.");
        }
        if (options.nesterov && (options.momentum <= 0.0 || options.dampening != 0.0)) {
            throw ::Tessel::ConfigurationError("SGD Nesterov momentum requires a positive momentum and zero dampening.");
        }
        torch::optim::SGDOptions torch_options(options.learning_rate);
        torch_options = torch_options.momentum(options.momentum);
        torch_options = torch_options.dampening(options.dampening);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.nesterov(options.nesterov);
        return torch_options;
    }
}

#endif //TESSEL_SGD_HPP
