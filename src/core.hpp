#ifndef TESSEL_CORE_HPP
#define TESSEL_CORE_HPP
/*
 * Core orchestrator of the library.
 * ---------------------------------------------------------------------------
 * Responsibilities:
 *  - Hold the immutable model configuration (input/output widths, ordered
 *    hidden widths, dropout, hidden activation) and expand it into the explicit
 *    ordered list of layer descriptors the network is built from.
 *  - Register the layers on a torch::nn::Module so LibTorch owns parameters,
 *    autograd and serialisation.
 *  - Expose the supervised training step (zero_grad / forward / NLL / backward
 *    / optimizer step), the epoch loop built on top of it, and inference-mode
 *    evaluation.
 */

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "activation/activation.hpp"
#include "common/error.hpp"
#include "evaluation/evaluation.hpp"
#include "layer/layer.hpp"
#include "loss/loss.hpp"
#include "optimizer/optimizer.hpp"
#include "utils/terminal.hpp"

namespace Tessel {
    struct ModelConfig {
        std::int64_t input_size{};
        std::int64_t output_size{};
        std::vector<std::int64_t> hidden_layers{};
        double dropout{0.5};
        Activation::Descriptor activation{Activation::ReLU};

        void validate() const
        {
            if (input_size <= 0) {
                throw ConfigurationError("Model input size must be positive (got " + std::to_string(input_size) + ").");
            }
            if (output_size <= 0) {
                throw ConfigurationError("Model output size must be positive (got " + std::to_string(output_size) + ").");
            }
            for (std::size_t index = 0; index < hidden_layers.size(); ++index) {
                if (hidden_layers[index] <= 0) {
                    throw ConfigurationError("Hidden layer " + std::to_string(index) + " width must be positive (got "
                                             + std::to_string(hidden_layers[index]) + ").");
                }
            }
            if (activation.type == Activation::Type::Identity) {
                throw ConfigurationError("Hidden activation must be non-linear (relu, sigmoid or tanh).");
            }
            if (!(dropout >= 0.0 && dropout < 1.0)) {
                throw ConfigurationError("Dropout probability must be in the range [0, 1) (got "
                                         + std::to_string(dropout) + ").");
            }
        }

        // Affine layer widths, input first: {input, h1, ..., h_last, output}.
        [[nodiscard]] std::vector<std::int64_t> widths() const
        {
            std::vector<std::int64_t> result;
            result.reserve(hidden_layers.size() + 2);
            result.push_back(input_size);
            result.insert(result.end(), hidden_layers.begin(), hidden_layers.end());
            result.push_back(output_size);
            return result;
        }

        // Ordered layer list: (FC + activation, Dropout) per hidden width, then the output FC.
        [[nodiscard]] std::vector<Layer::Descriptor> layers() const
        {
            const auto sizes = widths();
            std::vector<Layer::Descriptor> descriptors;
            descriptors.reserve(hidden_layers.size() * 2 + 1);
            for (std::size_t index = 0; index + 1 < sizes.size(); ++index) {
                const bool is_output = index + 2 == sizes.size();
                descriptors.emplace_back(Layer::FC({sizes[index], sizes[index + 1], true},
                                                   is_output ? Activation::Identity : activation,
                                                   "fc_" + std::to_string(index)));
                if (!is_output) {
                    descriptors.emplace_back(Layer::Dropout({.probability = dropout},
                                                            Activation::Identity,
                                                            "dropout_" + std::to_string(index)));
                }
            }
            return descriptors;
        }

        [[nodiscard]] std::vector<std::pair<std::string, std::vector<std::int64_t>>> parameter_shapes() const
        {
            const auto sizes = widths();
            std::vector<std::pair<std::string, std::vector<std::int64_t>>> shapes;
            shapes.reserve((sizes.size() - 1) * 2);
            for (std::size_t index = 0; index + 1 < sizes.size(); ++index) {
                const auto prefix = "fc_" + std::to_string(index);
                shapes.emplace_back(prefix + ".weight", std::vector<std::int64_t>{sizes[index + 1], sizes[index]});
                shapes.emplace_back(prefix + ".bias", std::vector<std::int64_t>{sizes[index + 1]});
            }
            return shapes;
        }

        [[nodiscard]] bool operator==(const ModelConfig& other) const
        {
            return input_size == other.input_size && output_size == other.output_size
                   && hidden_layers == other.hidden_layers && dropout == other.dropout
                   && activation.type == other.activation.type;
        }
    };

    struct TrainOptions {
        std::size_t epoch{5};
        std::size_t batch_size{64};
        bool shuffle{true};
        bool monitor{true};
        // Steps between intermediate validation reports (0 disables them).
        std::size_t print_every{0};
        bool restore_best_state{false};
        std::optional<std::pair<torch::Tensor, torch::Tensor>> validation{};
        std::ostream* stream{&std::cout};
    };

    struct TrainingHistory {
        struct EpochSnapshot {
            std::size_t epoch{0};
            double train_loss{std::numeric_limits<double>::quiet_NaN()};
            std::optional<double> validation_loss{};
            std::optional<double> validation_accuracy{};
            double duration_seconds{0.0};
        };

        std::vector<EpochSnapshot> epochs{};
        std::optional<std::size_t> best_epoch{};

        [[nodiscard]] bool empty() const noexcept { return epochs.empty(); }
    };

    class Model : public torch::nn::Module {
    public:
        explicit Model(ModelConfig config)
            : config_(std::move(config))
        {
            config_.validate();
            const auto descriptors = config_.layers();
            layers_.reserve(descriptors.size());
            for (std::size_t index = 0; index < descriptors.size(); ++index) {
                layers_.push_back(Layer::Details::build_registered_layer(*this, descriptors[index], index));
            }
            this->to(device_);
        }

        [[nodiscard]] const ModelConfig& config() const noexcept { return config_; }

        void train(bool on = true) override { torch::nn::Module::train(on); }

        Model& to_device(bool use_cuda)
        {
            if (use_cuda && torch::cuda::is_available()) {
                device_ = torch::Device(torch::kCUDA, 0);
            } else {
                device_ = torch::Device(torch::kCPU);
            }
            this->to(device_);
            rebuild_optimizer();
            return *this;
        }

        [[nodiscard]] const torch::Device& device() const noexcept { return device_; }

        // [N, ...] -> [N, input_size]. A 1-D tensor of input_size elements is one sample.
        [[nodiscard]] torch::Tensor flatten(const torch::Tensor& input) const
        {
            if (!input.defined()) {
                throw std::invalid_argument("Model input tensor must be defined.");
            }
            if (input.dim() == 0) {
                throw std::invalid_argument("Model input must not be a scalar.");
            }
            if (input.dim() == 1) {
                if (input.size(0) != config_.input_size) {
                    throw std::invalid_argument("Sample has " + std::to_string(input.size(0))
                                                + " features but the model expects "
                                                + std::to_string(config_.input_size) + ".");
                }
                return input.reshape({1, config_.input_size});
            }

            const auto batch = input.size(0);
            const auto features = batch == 0 ? std::int64_t{0} : input.numel() / batch;
            if (batch > 0 && features != config_.input_size) {
                throw std::invalid_argument("Sample has " + std::to_string(features)
                                            + " elements but the model expects "
                                            + std::to_string(config_.input_size) + ".");
            }
            return input.reshape({batch, config_.input_size});
        }

        // Log-probabilities [N, output_size].
        [[nodiscard]] torch::Tensor forward(torch::Tensor input)
        {
            auto tensor = flatten(input);
            if (!tensor.is_floating_point()) {
                tensor = tensor.to(torch::kFloat32);
            }
            tensor = tensor.to(device_);
            for (const auto& layer : layers_) {
                tensor = layer(std::move(tensor));
            }
            return torch::log_softmax(tensor, /*dim=*/1);
        }

        [[nodiscard]] torch::Tensor predict_proba(torch::Tensor input)
        {
            torch::NoGradGuard no_grad{};
            Evaluation::Details::Classification::InferenceModeGuard mode_guard(*this);
            return torch::exp(forward(std::move(input)));
        }

        // Top-k (probabilities, classes), both [N, k].
        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> predict_topk(torch::Tensor input, std::int64_t k = 1)
        {
            if (k <= 0 || k > config_.output_size) {
                throw std::invalid_argument("Top-k requires 0 < k <= output size.");
            }
            auto [values, indices] = predict_proba(std::move(input)).topk(k, /*dim=*/1);
            return {values, indices};
        }

        void set_optimizer(Optimizer::Descriptor descriptor)
        {
            optimizer_ = Optimizer::Details::build_optimizer(*this, descriptor);
            optimizer_descriptor_ = std::move(descriptor);
        }

        [[nodiscard]] bool has_optimizer() const noexcept { return static_cast<bool>(optimizer_); }

        [[nodiscard]] torch::optim::Optimizer& optimizer() {
            if (!optimizer_) {
                throw std::logic_error("Optimizer has not been configured.");
            }
            return *optimizer_;
        }

        void set_loss(Loss::NegativeLogLikelihoodDescriptor descriptor) { loss_ = std::move(descriptor); }

        [[nodiscard]] const Loss::NegativeLogLikelihoodDescriptor& loss() const noexcept { return loss_; }

        [[nodiscard]] torch::Tensor compute_loss(const torch::Tensor& log_probs, const torch::Tensor& targets) const
        {
            return Loss::Details::compute(loss_, log_probs, targets.to(log_probs.device()));
        }

        // Gradients accumulate across backward() calls until this is called.
        void zero_grad(bool set_to_none = false) {
            if (optimizer_) {
                optimizer_->zero_grad(set_to_none);
            } else {
                torch::nn::Module::zero_grad(set_to_none);
            }
        }

        void step() {
            if (!optimizer_) {
                throw std::logic_error("Cannot step without an optimizer.");
            }
            optimizer_->step();
        }

        // One supervised update on a single batch; returns the batch loss.
        double train_step(const torch::Tensor& inputs, const torch::Tensor& targets)
        {
            if (!optimizer_) {
                throw std::logic_error("Cannot train without an optimizer.");
            }
            check_supervised_pair(inputs, targets, "Training");

            torch::nn::Module::train();
            zero_grad();
            auto log_probs = forward(inputs);
            // Always the batch mean: weighted by class, ignored targets excluded.
            auto descriptor = loss_;
            descriptor.options.reduction = Loss::Reduction::Mean;
            auto loss = Loss::Details::compute(descriptor, log_probs, targets.to(device_, torch::kLong));
            loss.backward();
            step();
            return loss.detach().item<double>();
        }

        Evaluation::ClassificationReport evaluate(torch::Tensor inputs, torch::Tensor targets, Evaluation::Options options = {})
        {
            return Evaluation::Evaluate(*this, std::move(inputs), std::move(targets), options);
        }

        TrainingHistory train(torch::Tensor train_inputs, torch::Tensor train_targets, TrainOptions options = {})
        {
            if (!optimizer_) {
                throw std::logic_error("Cannot train without an optimizer.");
            }
            check_supervised_pair(train_inputs, train_targets, "Training");
            if (options.batch_size == 0) {
                throw std::invalid_argument("Batch size must be greater than zero.");
            }
            if (options.validation) {
                check_supervised_pair(options.validation->first, options.validation->second, "Validation");
            }

            TrainingHistory history{};
            const auto total_samples = train_inputs.size(0);
            if (options.epoch == 0 || total_samples == 0) {
                return history;
            }

            std::ostream* stream = options.monitor ? options.stream : nullptr;
            const auto batch_size = static_cast<std::int64_t>(options.batch_size);
            std::optional<double> best_loss{};
            std::vector<torch::Tensor> best_state{};
            std::size_t global_step = 0;

            for (std::size_t epoch = 1; epoch <= options.epoch; ++epoch) {
                const auto started = std::chrono::steady_clock::now();
                torch::nn::Module::train();

                auto order = options.shuffle
                    ? torch::randperm(total_samples, torch::TensorOptions().dtype(torch::kLong))
                    : torch::arange(total_samples, torch::TensorOptions().dtype(torch::kLong));
                order = order.to(train_inputs.device());

                double running_loss = 0.0;
                double window_loss = 0.0;
                std::size_t window_steps = 0;

                for (std::int64_t begin = 0; begin < total_samples; begin += batch_size) {
                    const auto length = std::min(batch_size, total_samples - begin);
                    auto indices = order.narrow(0, begin, length);
                    auto batch_inputs = train_inputs.index_select(0, indices);
                    auto batch_targets = train_targets.index_select(0, indices.to(train_targets.device()));

                    const double batch_loss = train_step(batch_inputs, batch_targets);
                    running_loss += batch_loss * static_cast<double>(length);
                    window_loss += batch_loss;
                    ++window_steps;
                    ++global_step;

                    if (options.print_every > 0 && global_step % options.print_every == 0) {
                        if (stream != nullptr) {
                            log_step(*stream, epoch, options.epoch, window_loss / static_cast<double>(window_steps),
                                     options.validation ? std::optional<Evaluation::ClassificationReport>(evaluate(
                                                              options.validation->first, options.validation->second))
                                                        : std::nullopt);
                        }
                        window_loss = 0.0;
                        window_steps = 0;
                    }
                }

                TrainingHistory::EpochSnapshot snapshot{};
                snapshot.epoch = epoch;
                snapshot.train_loss = running_loss / static_cast<double>(total_samples);

                bool improved = false;
                if (options.validation) {
                    const auto report = evaluate(options.validation->first, options.validation->second);
                    snapshot.validation_loss = report.loss;
                    snapshot.validation_accuracy = report.accuracy;
                    if (!best_loss || report.loss < *best_loss) {
                        improved = true;
                        best_loss = report.loss;
                        history.best_epoch = epoch;
                        if (options.restore_best_state) {
                            best_state = snapshot_parameters();
                        }
                    }
                }

                snapshot.duration_seconds =
                    std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
                if (stream != nullptr) {
                    log_epoch(*stream, snapshot, options.epoch, improved);
                }
                history.epochs.push_back(std::move(snapshot));
            }

            if (options.restore_best_state && !best_state.empty()) {
                if (stream != nullptr) {
                    *stream << "[Tessel] Reloading best state of the network (epoch " << *history.best_epoch << ")..."
                            << std::endl;
                }
                restore_parameters(best_state);
            }
            return history;
        }

    private:
        static void check_supervised_pair(const torch::Tensor& inputs, const torch::Tensor& targets, const char* context)
        {
            if (!inputs.defined() || !targets.defined()) {
                throw std::invalid_argument(std::string(context) + " tensors must be defined.");
            }
            if (inputs.dim() == 0 || targets.dim() != 1) {
                throw std::invalid_argument(std::string(context) + " expects batched inputs and one label per sample.");
            }
            if (inputs.size(0) != targets.size(0)) {
                throw std::invalid_argument("Mismatched number of " + std::string(context)
                                            + " samples between inputs and targets.");
            }
            if (targets.is_floating_point() || targets.is_complex()) {
                throw std::invalid_argument(std::string(context) + " labels must be integer class indices.");
            }
        }

        [[nodiscard]] std::vector<torch::Tensor> snapshot_parameters() const
        {
            torch::NoGradGuard no_grad{};
            std::vector<torch::Tensor> state;
            for (const auto& parameter : this->parameters()) {
                state.push_back(parameter.detach().clone());
            }
            return state;
        }

        void restore_parameters(const std::vector<torch::Tensor>& state)
        {
            torch::NoGradGuard no_grad{};
            auto parameters = this->parameters();
            for (std::size_t index = 0; index < parameters.size() && index < state.size(); ++index) {
                parameters[index].copy_(state[index]);
            }
        }

        // Optimizer state is bound to parameter tensors; rebuild it after a device move.
        void rebuild_optimizer()
        {
            if (optimizer_descriptor_) {
                optimizer_ = Optimizer::Details::build_optimizer(*this, *optimizer_descriptor_);
            }
        }

        static void log_step(std::ostream& stream,
                             std::size_t epoch_index,
                             std::size_t total_epochs,
                             double train_loss,
                             const std::optional<Evaluation::ClassificationReport>& report)
        {
            std::ostringstream line;
            line << "Epoch: " << epoch_index << "/" << total_epochs << ".. "
                 << "Training Loss: " << std::fixed << std::setprecision(3) << train_loss;
            if (report) {
                line << ".. Test Loss: " << std::fixed << std::setprecision(3) << report->loss
                     << ".. Test Accuracy: " << std::fixed << std::setprecision(3) << report->accuracy;
            }
            stream << line.str() << '\n';
        }

        static void log_epoch(std::ostream& stream,
                              const TrainingHistory::EpochSnapshot& snapshot,
                              std::size_t total_epochs,
                              bool improved)
        {
            using Utils::Terminal::ApplyColor;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightBlue;
            using Utils::Terminal::Colors::kBrightGreen;
            using Utils::Terminal::Colors::kBrightRed;
            using Utils::Terminal::Colors::kBrightYellow;

            std::ostringstream line;
            line << "Epoch [" << snapshot.epoch << "/" << total_epochs << "] | ";
            line << ApplyColor("Train", kBrightYellow) << " loss: "
                 << std::fixed << std::setprecision(6) << snapshot.train_loss << " | ";
            line << ApplyColor("Test", kBrightBlue) << " loss: ";
            if (snapshot.validation_loss) {
                line << std::fixed << std::setprecision(6) << *snapshot.validation_loss
                     << " | accuracy: " << std::fixed << std::setprecision(4) << *snapshot.validation_accuracy;
                if (improved) {
                    line << ' ' << ApplyColor(Utils::Terminal::Symbols::kCheck, kBrightGreen);
                } else {
                    line << ' ' << ApplyColor(Utils::Terminal::Symbols::kCross, kBrightRed);
                }
            } else {
                line << "N/A";
            }

            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << snapshot.duration_seconds << "sec";
            line << " | " << ApplyColor("duration: " + duration_stream.str(), kBrightBlack);

            stream << line.str() << '\n';
        }

        ModelConfig config_;
        std::vector<Layer::Details::RegisteredLayer> layers_{};
        std::unique_ptr<torch::optim::Optimizer> optimizer_{};
        std::optional<Optimizer::Descriptor> optimizer_descriptor_{};
        Loss::NegativeLogLikelihoodDescriptor loss_{};
        torch::Device device_{torch::kCPU};
    };
}

#endif // TESSEL_CORE_HPP
