#ifndef TESSEL_LAYER_HPP
#define TESSEL_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <string>
#include <utility>
#include <variant>

#include "details/dropout.hpp"
#include "details/fc.hpp"

#include "registry.hpp"

namespace Tessel::Layer {
    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using DropoutOptions = Details::DropoutOptions;
    using DropoutDescriptor = Details::DropoutDescriptor;

    using Descriptor = std::variant<FCDescriptor, DropoutDescriptor>;

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Tessel::Activation::Descriptor activation = ::Tessel::Activation::Identity,
                                 std::string name = {}) -> FCDescriptor {
        return {options, activation, std::move(name)};
    }

    [[nodiscard]] inline auto Dropout(const DropoutOptions& options,
                                      ::Tessel::Activation::Descriptor activation = ::Tessel::Activation::Identity,
                                      std::string name = {}) -> DropoutDescriptor {
        return {options, activation, std::move(name)};
    }
}

#endif //TESSEL_LAYER_HPP
