#ifndef TESSEL_TEST_HELPERS_HPP
#define TESSEL_TEST_HELPERS_HPP
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../../include/Tessel.h"

namespace Tessel::Testing {
    inline ModelConfig small_config(std::vector<std::int64_t> hidden = {16, 8}, std::int64_t input = 12, std::int64_t output = 3)
    {
        ModelConfig config{};
        config.input_size = input;
        config.output_size = output;
        config.hidden_layers = std::move(hidden);
        config.dropout = 0.2;
        return config;
    }

    // Three well separated Gaussian clusters in `features` dimensions.
    inline std::pair<torch::Tensor, torch::Tensor> gaussian_clusters(std::int64_t per_class, std::int64_t features)
    {
        std::vector<torch::Tensor> inputs;
        std::vector<torch::Tensor> labels;
        for (std::int64_t label = 0; label < 3; ++label) {
            auto center = torch::zeros({features});
            center[label % features] = 4.0;
            inputs.push_back(torch::randn({per_class, features}) * 0.5 + center);
            labels.push_back(torch::full({per_class}, label, torch::kLong));
        }
        return {torch::cat(inputs), torch::cat(labels)};
    }

    // Removes its directory on scope exit.
    class ScratchDirectory {
    public:
        ScratchDirectory()
        {
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            std::string name = "tessel_";
            if (info != nullptr) {
                name += std::string(info->test_suite_name()) + "_" + info->name();
            }
            path_ = std::filesystem::temp_directory_path() / name;
            std::filesystem::remove_all(path_);
            std::filesystem::create_directories(path_);
        }
        ~ScratchDirectory()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        ScratchDirectory(const ScratchDirectory&) = delete;
        ScratchDirectory& operator=(const ScratchDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
        [[nodiscard]] std::filesystem::path file(const std::string& name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };
}

#endif // TESSEL_TEST_HELPERS_HPP
