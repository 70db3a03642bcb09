#ifndef TESSEL_DATA_LOAD_HPP
#define TESSEL_DATA_LOAD_HPP
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

#include <torch/torch.h>

namespace Tessel::Data::Load {
    namespace Details {
        inline constexpr std::array<const char*, 4> kIdxFiles = {
            "train-images-idx3-ubyte",
            "train-labels-idx1-ubyte",
            "t10k-images-idx3-ubyte",
            "t10k-labels-idx1-ubyte"
        };

        // Accepts the directory itself or the torchvision layouts <root>/<Name> and <root>/<Name>/raw.
        inline std::filesystem::path resolve_idx_root(const std::string& root, const std::string& name)
        {
            const std::array<std::filesystem::path, 3> candidates = {
                std::filesystem::path(root),
                std::filesystem::path(root) / name,
                std::filesystem::path(root) / name / "raw"
            };

            for (const auto& candidate : candidates) {
                if (!std::filesystem::exists(candidate)) {
                    continue;
                }
                const bool has_all_files = std::all_of(kIdxFiles.begin(), kIdxFiles.end(), [&](const char* file) {
                    return std::filesystem::exists(candidate / file);
                });
                if (has_all_files) {
                    return candidate;
                }
            }

            throw std::runtime_error("Unable to locate " + name + " dataset in the provided root: " + root);
        }

        inline std::int64_t fraction_count(float fraction, std::int64_t total, const char* which)
        {
            if (!std::isfinite(fraction) || fraction < 0.0f || fraction > 1.0f) {
                throw std::invalid_argument(std::string(which) + " fraction must lie in [0, 1].");
            }
            const auto count = static_cast<std::int64_t>(std::llround(fraction * static_cast<double>(total)));
            return std::clamp<std::int64_t>(count, 0, total);
        }

        // torch::data::datasets::MNIST yields pixels already scaled to [0, 1].
        inline std::pair<torch::Tensor, torch::Tensor> read_split(const std::filesystem::path& directory,
                                                                  torch::data::datasets::MNIST::Mode mode,
                                                                  float fraction,
                                                                  bool normalise,
                                                                  const char* which)
        {
            torch::Tensor images;
            torch::Tensor labels;
            try {
                torch::data::datasets::MNIST dataset(directory.string(), mode);
                images = dataset.images();
                labels = dataset.targets();
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to decode " + std::string(which) + " split in '" + directory.string()
                                         + "': " + error.what_without_backtrace());
            }

            if (images.size(0) != labels.size(0)) {
                throw std::runtime_error(std::string(which) + " images and labels count mismatch in " + directory.string());
            }

            const auto count = fraction_count(fraction, images.size(0), which);
            if (count < images.size(0)) {
                images = images.narrow(0, 0, count).clone();
                labels = labels.narrow(0, 0, count).clone();
            }

            images = images.to(torch::kFloat32);
            if (normalise) {
                images = images.sub(0.5).div(0.5);
            }
            return {std::move(images), labels.to(torch::kLong)};
        }

        inline std::tuple<torch::Tensor, torch::Tensor, torch::Tensor, torch::Tensor>
        idx_dataset(const std::string& root, const std::string& name, float train_fraction, float test_fraction, bool normalise)
        {
            const auto directory = resolve_idx_root(root, name);
            auto [train_inputs, train_targets] = read_split(directory, torch::data::datasets::MNIST::Mode::kTrain,
                                                            train_fraction, normalise, "training");
            auto [test_inputs, test_targets] = read_split(directory, torch::data::datasets::MNIST::Mode::kTest,
                                                          test_fraction, normalise, "test");
            return {train_inputs, train_targets, test_inputs, test_targets};
        }
    }

    /// Returns (train_x, train_y, test_x, test_y); images are [N, 1, 28, 28] float, labels int64.
    /// With `normalise` the pixels are mapped to [-1, 1] (mean 0.5, std 0.5).
    [[nodiscard]] inline std::tuple<torch::Tensor, torch::Tensor, torch::Tensor, torch::Tensor>
    MNIST(const std::string& root, float train_fraction = 1.0f, float test_fraction = 1.0f, bool normalise = true) {
        return Details::idx_dataset(root, "MNIST", train_fraction, test_fraction, normalise);
    }

    // Same IDX layout and 10 classes as MNIST.
    [[nodiscard]] inline std::tuple<torch::Tensor, torch::Tensor, torch::Tensor, torch::Tensor>
    FashionMNIST(const std::string& root, float train_fraction = 1.0f, float test_fraction = 1.0f, bool normalise = true) {
        return Details::idx_dataset(root, "FashionMNIST", train_fraction, test_fraction, normalise);
    }
}

#endif // TESSEL_DATA_LOAD_HPP
