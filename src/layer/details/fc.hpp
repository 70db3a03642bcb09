#ifndef TESSEL_FC_HPP
#define TESSEL_FC_HPP

#include <cstdint>
#include <string>
#include <utility>

#include <torch/nn/module.h>
#include <torch/nn/modules/linear.h>
#include <torch/nn/options/linear.h>
#include "../../activation/activation.hpp"
#include "../../common/error.hpp"
#include "../registry.hpp"


namespace Tessel::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        bool bias{true};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Tessel::Activation::Descriptor activation{::Tessel::Activation::Identity};
        std::string name{};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FCDescriptor& descriptor, std::size_t index)
    {
        if (descriptor.options.in_features <= 0 || descriptor.options.out_features <= 0) {
            throw ::Tessel::ConfigurationError(
                "Fully connected layers require positive in/out features (got "
                + std::to_string(descriptor.options.in_features) + " -> "
                + std::to_string(descriptor.options.out_features) + ").");
        }

        auto options = torch::nn::LinearOptions(descriptor.options.in_features, descriptor.options.out_features)
                            .bias(descriptor.options.bias);
        auto name = descriptor.name.empty() ? "fc_" + std::to_string(index) : descriptor.name;
        auto module = owner.register_module(name, torch::nn::Linear(options));

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;
        registered_layer.name = std::move(name);
        registered_layer.bind(module);
        return registered_layer;
    }
}

#endif //TESSEL_FC_HPP
