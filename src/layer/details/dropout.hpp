#ifndef TESSEL_DROPOUT_HPP
#define TESSEL_DROPOUT_HPP

#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../common/error.hpp"
#include "../registry.hpp"

namespace Tessel::Layer::Details {

    struct DropoutOptions {
        double probability{0.5};
        bool inplace{false};
    };

    struct DropoutDescriptor {
        DropoutOptions options{};
        ::Tessel::Activation::Descriptor activation{::Tessel::Activation::Identity};
        std::string name{};
    };

    // Inverted dropout; a no-op outside training mode.
    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const DropoutDescriptor& descriptor, std::size_t index)
    {
        if (!(descriptor.options.probability >= 0.0 && descriptor.options.probability < 1.0)) {
            throw ::Tessel::ConfigurationError("Dropout probability must be in the range [0, 1) (got "
                                               + std::to_string(descriptor.options.probability) + ").");
        }

        auto options = torch::nn::DropoutOptions(descriptor.options.probability).inplace(descriptor.options.inplace);
        auto name = descriptor.name.empty() ? "dropout_" + std::to_string(index) : descriptor.name;
        auto module = owner.register_module(name, torch::nn::Dropout(options));

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;
        registered_layer.name = std::move(name);
        registered_layer.bind(module);
        return registered_layer;
    }
}

#endif //TESSEL_DROPOUT_HPP
