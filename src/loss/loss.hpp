#ifndef TESSEL_LOSS_HPP
#define TESSEL_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/reduction.hpp"
#include "details/nll.hpp"

namespace Tessel::Loss {
    using Reduction = Details::Reduction;

    using NegativeLogLikelihoodOptions = Details::NegativeLogLikelihoodOptions;
    using NegativeLogLikelihoodDescriptor = Details::NegativeLogLikelihoodDescriptor;

    [[nodiscard]] inline auto NegativeLogLikelihood(const NegativeLogLikelihoodOptions& options = {}) -> NegativeLogLikelihoodDescriptor {
        return {options};
    }
}

#endif //TESSEL_LOSS_HPP
