#ifndef TESSEL_EVALUATION_HPP
#define TESSEL_EVALUATION_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <utility>

#include <torch/torch.h>

#include "details/classification.hpp"

namespace Tessel::Evaluation {
    using Options = Details::Classification::Options;
    using ClassificationReport = Details::Classification::Report;

    using Details::Classification::accuracy;

    template <class Model>
    [[nodiscard]] inline auto Evaluate(Model& model,
                                       torch::Tensor inputs,
                                       torch::Tensor targets,
                                       const Options& options = Options{}) -> ClassificationReport {
        return Details::Classification::Evaluate(model, std::move(inputs), std::move(targets), options);
    }
}

#endif //TESSEL_EVALUATION_HPP
