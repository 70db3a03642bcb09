#ifndef TESSEL_ACTIVATION_APPLY_HPP
#define TESSEL_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <utility>

#include "activation.hpp"

namespace Tessel::Activation::Details {
    inline torch::Tensor apply(::Tessel::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Tessel::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Tessel::Activation::Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case ::Tessel::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Tessel::Activation::Type::Identity:
            default:
                return input;
        }
    }
}
#endif // TESSEL_ACTIVATION_APPLY_HPP
