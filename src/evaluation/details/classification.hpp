#ifndef TESSEL_CLASSIFICATION_HPP
#define TESSEL_CLASSIFICATION_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../loss/loss.hpp"
#include "../../utils/terminal.hpp"

namespace Tessel::Evaluation::Details::Classification {
    struct Options {
        std::size_t batch_size{256};
        bool print_summary{false};
        std::ostream* stream{&std::cout};
    };

    struct Report {
        double loss{std::numeric_limits<double>::quiet_NaN()};
        double accuracy{std::numeric_limits<double>::quiet_NaN()};
        std::size_t correct{0};
        std::size_t samples{0};
    };

    // Restores the module's previous training flag on scope exit.
    class InferenceModeGuard {
    public:
        explicit InferenceModeGuard(torch::nn::Module& module)
            : module_(module), was_training_(module.is_training())
        {
            module_.eval();
        }
        ~InferenceModeGuard() { module_.train(was_training_); }

        InferenceModeGuard(const InferenceModeGuard&) = delete;
        InferenceModeGuard& operator=(const InferenceModeGuard&) = delete;

    private:
        torch::nn::Module& module_;
        bool was_training_;
    };

    inline std::int64_t count_correct(const torch::Tensor& log_probs, const torch::Tensor& targets)
    {
        if (log_probs.dim() != 2 || targets.dim() != 1 || log_probs.size(0) != targets.size(0)) {
            throw std::invalid_argument("Accuracy expects [batch, classes] scores and one label per sample.");
        }
        auto predicted = log_probs.argmax(1).to(torch::kLong);
        return predicted.eq(targets.to(predicted.device(), torch::kLong)).sum().item<std::int64_t>();
    }

    // Fraction of argmax predictions equal to the labels.
    inline double accuracy(const torch::Tensor& log_probs, const torch::Tensor& targets)
    {
        const auto total = targets.numel();
        if (total == 0) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return static_cast<double>(count_correct(log_probs, targets)) / static_cast<double>(total);
    }

    // Denominator of a mean-reduced NLL over `targets`: the class weight of every
    // non-ignored target (one per target when unweighted).
    inline double loss_normaliser(const ::Tessel::Loss::NegativeLogLikelihoodDescriptor& descriptor,
                                  const torch::Tensor& targets)
    {
        auto kept = targets.to(torch::kLong);
        if (descriptor.options.ignore_index) {
            kept = kept.masked_select(kept.ne(*descriptor.options.ignore_index));
        }
        if (descriptor.options.weight.empty()) {
            return static_cast<double>(kept.numel());
        }
        auto weight = torch::tensor(descriptor.options.weight, torch::TensorOptions().dtype(torch::kFloat64))
                          .to(kept.device());
        return weight.index_select(0, kept).sum().item<double>();
    }

    inline void print_summary(std::ostream& stream, const Report& report)
    {
        using namespace ::Tessel::Utils::Terminal;
        const std::vector<std::size_t> spans{14, 14};

        std::ostringstream loss;
        loss << std::fixed << std::setprecision(6) << report.loss;
        std::ostringstream accuracy;
        accuracy << std::fixed << std::setprecision(4) << report.accuracy;

        stream << HSeparator(spans, Colors::kBrightCyan, HSepKind::Top) << '\n'
               << Row({"Metric", "Value"}, spans, Colors::kBrightCyan) << '\n'
               << HSeparator(spans, Colors::kBrightCyan, HSepKind::Middle) << '\n'
               << Row({"Samples", std::to_string(report.samples)}, spans, Colors::kBrightCyan) << '\n'
               << Row({"Loss", loss.str()}, spans, Colors::kBrightCyan) << '\n'
               << Row({"Accuracy", accuracy.str()}, spans, Colors::kBrightCyan) << '\n'
               << HSeparator(spans, Colors::kBrightCyan, HSepKind::Bottom) << '\n';
    }

    template <class Model>
    [[nodiscard]] Report Evaluate(Model& model, torch::Tensor inputs, torch::Tensor targets, const Options& options)
    {
        if (!inputs.defined() || !targets.defined()) {
            throw std::invalid_argument("Evaluation requires defined input and target tensors.");
        }
        if (inputs.dim() == 0 || targets.dim() != 1) {
            throw std::invalid_argument("Evaluation expects batched inputs and one label per sample.");
        }
        if (inputs.size(0) != targets.size(0)) {
            throw std::invalid_argument("Mismatched number of evaluation samples between inputs and targets.");
        }
        if (options.batch_size == 0) {
            throw std::invalid_argument("Evaluation batch size must be greater than zero.");
        }

        Report report{};
        const auto total = inputs.size(0);
        if (total == 0) {
            return report;
        }

        torch::NoGradGuard no_grad{};
        InferenceModeGuard mode_guard(model);

        const auto device = model.device();
        const auto batch = static_cast<std::int64_t>(options.batch_size);
        auto loss_descriptor = model.loss();
        loss_descriptor.options.reduction = ::Tessel::Loss::Reduction::Sum;
        double loss_sum = 0.0;
        double loss_weight = 0.0;
        std::int64_t correct = 0;

        for (std::int64_t begin = 0; begin < total; begin += batch) {
            const auto length = std::min(batch, total - begin);
            auto batch_inputs = inputs.narrow(0, begin, length).to(device);
            auto batch_targets = targets.narrow(0, begin, length).to(device, torch::kLong);

            auto log_probs = model.forward(batch_inputs);
            loss_sum += ::Tessel::Loss::Details::compute(loss_descriptor, log_probs, batch_targets).template item<double>();
            loss_weight += loss_normaliser(loss_descriptor, batch_targets);
            correct += count_correct(log_probs, batch_targets);
        }

        report.samples = static_cast<std::size_t>(total);
        report.correct = static_cast<std::size_t>(correct);
        report.loss = loss_weight > 0.0 ? loss_sum / loss_weight : std::numeric_limits<double>::quiet_NaN();
        report.accuracy = static_cast<double>(correct) / static_cast<double>(total);

        if (options.print_summary && options.stream != nullptr) {
            print_summary(*options.stream, report);
        }
        return report;
    }
}

#endif // TESSEL_CLASSIFICATION_HPP
