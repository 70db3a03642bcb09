#ifndef TESSEL_LOSS_REDUCTION_HPP
#define TESSEL_LOSS_REDUCTION_HPP

#include <string>
#include <string_view>
#include <type_traits>

#include <torch/torch.h>

#include "../../common/error.hpp"

namespace Tessel::Loss::Details {

    enum class Reduction { Mean, Sum, None };

    // Use: to_torch_reduction<torch::nn::functional::NLLLossFuncOptions>(Reduction::Mean)
    template <typename Options>
    inline typename Options::reduction_t to_torch_reduction(Reduction r) {
        using RT = typename Options::reduction_t;
        static_assert(!std::is_void_v<RT>, "Options must define nested type 'reduction_t'");

        switch (r) {
            case Reduction::Sum:  return RT{torch::kSum};
            case Reduction::None: return RT{torch::kNone};
            case Reduction::Mean:
            default:              return RT{torch::kMean};
        }
    }

    inline std::string to_string(Reduction reduction)
    {
        switch (reduction) {
            case Reduction::None: return "none";
            case Reduction::Sum: return "sum";
            case Reduction::Mean:
            default: return "mean";
        }
    }

    inline Reduction reduction_from_string(std::string_view value)
    {
        if (value == "mean") return Reduction::Mean;
        if (value == "sum") return Reduction::Sum;
        if (value == "none") return Reduction::None;
        throw ::Tessel::ConfigurationError("Unknown loss reduction '" + std::string(value) + "'.");
    }
}

#endif // TESSEL_LOSS_REDUCTION_HPP
