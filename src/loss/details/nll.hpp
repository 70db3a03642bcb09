#ifndef TESSEL_NLL_HPP
#define TESSEL_NLL_HPP

#include <optional>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "reduction.hpp"

namespace Tessel::Loss::Details {
    struct NegativeLogLikelihoodOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        std::optional<int64_t> ignore_index{};
    };

    struct NegativeLogLikelihoodDescriptor {
        NegativeLogLikelihoodOptions options{};
    };

    // `prediction` holds log-probabilities [N, C]; `target` holds class indices [N].
    inline torch::Tensor compute(const NegativeLogLikelihoodDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target)
    {
        if (prediction.dim() != 2) {
            throw std::invalid_argument("Negative log-likelihood expects [batch, classes] log-probabilities.");
        }
        if (target.dim() != 1 || target.size(0) != prediction.size(0)) {
            throw std::invalid_argument("Negative log-likelihood expects one class index per sample.");
        }

        auto opts = torch::nn::functional::NLLLossFuncOptions{};
        opts = opts.reduction(to_torch_reduction<torch::nn::functional::NLLLossFuncOptions>(descriptor.options.reduction));

        if (!descriptor.options.weight.empty()) {
            if (static_cast<int64_t>(descriptor.options.weight.size()) != prediction.size(1)) {
                throw std::invalid_argument("Negative log-likelihood class weights must match the number of classes.");
            }
            auto weight_tensor = torch::tensor(
                descriptor.options.weight,
                torch::TensorOptions().dtype(torch::kFloat64)).to(prediction.device(), prediction.scalar_type());
            opts = opts.weight(weight_tensor);
        }

        if (descriptor.options.ignore_index.has_value()) {
            opts = opts.ignore_index(descriptor.options.ignore_index.value());
        }

        return torch::nn::functional::nll_loss(prediction, target.to(torch::kLong), opts);
    }
}

#endif // TESSEL_NLL_HPP
