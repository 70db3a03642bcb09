#ifndef TESSEL_ACTIVATION_HPP
#define TESSEL_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"
#include <string>
#include <string_view>

#include "../common/error.hpp"

namespace Tessel::Activation {
    enum class Type {
        Identity,
        ReLU,
        Sigmoid,
        Tanh,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};

    [[nodiscard]] inline std::string to_string(Type type)
    {
        switch (type) {
            case Type::ReLU: return "relu";
            case Type::Sigmoid: return "sigmoid";
            case Type::Tanh: return "tanh";
            case Type::Identity:
            default: return "identity";
        }
    }

    [[nodiscard]] inline Type from_string(std::string_view value)
    {
        if (value == "identity") return Type::Identity;
        if (value == "relu") return Type::ReLU;
        if (value == "sigmoid") return Type::Sigmoid;
        if (value == "tanh") return Type::Tanh;
        throw ConfigurationError("Unknown activation '" + std::string(value) + "'.");
    }
}

#endif //TESSEL_ACTIVATION_HPP
