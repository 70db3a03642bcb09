#ifndef TESSEL_LAYER_REGISTRY_HPP
#define TESSEL_LAYER_REGISTRY_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"

namespace Tessel::Layer::Details {
    template <class Impl>
    [[nodiscard]] inline std::shared_ptr<torch::nn::Module>
    to_shared_module_ptr(const torch::nn::ModuleHolder<Impl>& holder)
    {
        static_assert(std::is_base_of_v<torch::nn::Module, Impl>, "ModuleHolder implementation must derive from torch::nn::Module.");
        return std::static_pointer_cast<torch::nn::Module>(holder.ptr());
    }

    // One entry of the model's execution list: a registered torch module plus the
    // activation applied to its output.
    struct RegisteredLayer {
        struct ForwardBinding {
            using Invoker = torch::Tensor (*)(torch::nn::Module*, torch::Tensor);

            Invoker invoke{nullptr};
            torch::nn::Module* context{nullptr};

            [[nodiscard]] explicit operator bool() const noexcept { return invoke != nullptr; }

            torch::Tensor operator()(torch::Tensor input) const
            {
                if (!invoke) {
                    throw std::logic_error("Attempted to invoke an empty forward binding.");
                }
                return invoke(context, std::move(input));
            }
        };

        template <class Impl>
        void bind(const torch::nn::ModuleHolder<Impl>& holder)
        {
            module = to_shared_module_ptr(holder);
            forward = ForwardBinding{&dispatch_module<Impl>, module.get()};
        }

        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const
        {
            return ::Tessel::Activation::Details::apply(activation, forward(std::move(input)));
        }

        ForwardBinding forward{};
        ::Tessel::Activation::Type activation{::Tessel::Activation::Type::Identity};
        std::shared_ptr<torch::nn::Module> module{};
        std::string name{};

    private:
        template <class Impl>
        static torch::Tensor dispatch_module(torch::nn::Module* context, torch::Tensor input)
        {
            return static_cast<Impl*>(context)->forward(std::move(input));
        }
    };

    template <class Owner, class Descriptor>
    RegisteredLayer build_registered_layer(Owner&, const Descriptor&, std::size_t) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported layer descriptor provided to build_registered_layer.");
        return {};
    }

    template <class Owner, class... DescriptorTypes>
    RegisteredLayer build_registered_layer(Owner& owner, const std::variant<DescriptorTypes...>& descriptor, std::size_t index) {
        return std::visit(
            [&](const auto& concrete_descriptor) {
                return build_registered_layer(owner, concrete_descriptor, index);
            },
            descriptor);
    }
}

#endif // TESSEL_LAYER_REGISTRY_HPP
