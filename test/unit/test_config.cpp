#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <variant>

#include "test_helpers.hpp"

using Tessel::Testing::ScratchDirectory;

namespace {
    std::filesystem::path write_text(const ScratchDirectory& scratch, const std::string& name, const std::string& text)
    {
        const auto path = scratch.file(name);
        std::ofstream stream(path);
        stream << text;
        return path;
    }

    const char* const kRunConfig = R"({
        "dataset": {"name": "Fashion_MNIST", "root": "/data/fashion", "train_fraction": 0.5},
        "model": {"input_size": 784, "output_size": 10, "hidden_layers": [512, 256, 128], "dropout": 0.2},
        "optimizer": {"type": "adam", "learning_rate": 0.001},
        "loss": {"reduction": "Sum", "weight": [1.0, 2.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0]},
        "training": {"epochs": 2, "batch_size": 64, "print_every": 40},
        "checkpoint": "out/checkpoint.pt"
    })";
}

TEST(ConfigTest, LoadsRunConfiguration) {
    ScratchDirectory scratch;
    const auto config = Tessel::Config::load_run_config(write_text(scratch, "run.json", kRunConfig));

    EXPECT_EQ(config.dataset, "fashion_mnist");
    EXPECT_EQ(config.dataset_root, "/data/fashion");
    EXPECT_FLOAT_EQ(config.train_fraction, 0.5f);
    EXPECT_FLOAT_EQ(config.test_fraction, 1.0f);
    EXPECT_EQ(config.model.input_size, 784);
    EXPECT_EQ(config.model.hidden_layers, (std::vector<std::int64_t>{512, 256, 128}));
    EXPECT_DOUBLE_EQ(config.model.dropout, 0.2);
    EXPECT_EQ(config.model.activation.type, Tessel::Activation::Type::ReLU);
    ASSERT_TRUE(std::holds_alternative<Tessel::Optimizer::AdamDescriptor>(config.optimizer));
    EXPECT_DOUBLE_EQ(std::get<Tessel::Optimizer::AdamDescriptor>(config.optimizer).options.learning_rate, 0.001);
    EXPECT_EQ(config.loss.options.reduction, Tessel::Loss::Reduction::Sum);
    ASSERT_EQ(config.loss.options.weight.size(), 10u);
    EXPECT_DOUBLE_EQ(config.loss.options.weight[1], 2.0);
    EXPECT_FALSE(config.loss.options.ignore_index.has_value());
    EXPECT_EQ(config.epochs, 2u);
    EXPECT_EQ(config.batch_size, 64u);
    EXPECT_TRUE(config.shuffle);
    EXPECT_EQ(config.print_every, 40u);
    EXPECT_EQ(config.checkpoint, "out/checkpoint.pt");

    const auto options = Tessel::Config::train_options(config);
    EXPECT_EQ(options.epoch, 2u);
    EXPECT_EQ(options.batch_size, 64u);
}

TEST(ConfigTest, SavedConfigurationLoadsBack) {
    ScratchDirectory scratch;
    auto config = Tessel::Config::load_run_config(write_text(scratch, "run.json", kRunConfig));
    config.optimizer = Tessel::Optimizer::SGD({.learning_rate = 0.003, .momentum = 0.9});
    config.model.activation = Tessel::Activation::Sigmoid;
    config.loss.options.ignore_index = 3;

    const auto path = scratch.file("saved.json");
    Tessel::Config::save_run_config(config, path);
    const auto reloaded = Tessel::Config::load_run_config(path);

    EXPECT_TRUE(reloaded.model == config.model);
    ASSERT_TRUE(std::holds_alternative<Tessel::Optimizer::SGDDescriptor>(reloaded.optimizer));
    EXPECT_DOUBLE_EQ(std::get<Tessel::Optimizer::SGDDescriptor>(reloaded.optimizer).options.momentum, 0.9);
    EXPECT_EQ(reloaded.loss.options.reduction, Tessel::Loss::Reduction::Sum);
    EXPECT_EQ(reloaded.loss.options.weight, config.loss.options.weight);
    EXPECT_EQ(reloaded.loss.options.ignore_index, std::optional<std::int64_t>(3));
    EXPECT_EQ(reloaded.dataset, config.dataset);
    EXPECT_EQ(reloaded.print_every, config.print_every);
}

TEST(ConfigTest, MissingModelFieldRaisesConfigurationError) {
    ScratchDirectory scratch;
    const auto path = write_text(scratch, "broken.json", R"({
        "model": {"output_size": 10, "hidden_layers": [32]}
    })");
    EXPECT_THROW(static_cast<void>(Tessel::Config::load_run_config(path)), Tessel::ConfigurationError);
}

TEST(ConfigTest, InvalidValuesRaiseConfigurationError) {
    ScratchDirectory scratch;
    const auto optimizer = write_text(scratch, "optimizer.json", R"({
        "model": {"input_size": 4, "output_size": 2, "hidden_layers": [3]},
        "optimizer": {"type": "rmsprop"}
    })");
    EXPECT_THROW(static_cast<void>(Tessel::Config::load_run_config(optimizer)), Tessel::ConfigurationError);

    const auto activation = write_text(scratch, "activation.json", R"({
        "model": {"input_size": 4, "output_size": 2, "hidden_layers": [3], "activation": "swish"}
    })");
    EXPECT_THROW(static_cast<void>(Tessel::Config::load_run_config(activation)), Tessel::ConfigurationError);

    const auto linear = write_text(scratch, "linear.json", R"({
        "model": {"input_size": 4, "output_size": 2, "hidden_layers": [3], "activation": "identity"}
    })");
    EXPECT_THROW(static_cast<void>(Tessel::Config::load_run_config(linear)), Tessel::ConfigurationError);

    const auto width = write_text(scratch, "width.json", R"({
        "model": {"input_size": 4, "output_size": 2, "hidden_layers": [3, 0]}
    })");
    EXPECT_THROW(static_cast<void>(Tessel::Config::load_run_config(width)), Tessel::ConfigurationError);
}

TEST(ConfigTest, MalformedJsonRaisesRuntimeError) {
    ScratchDirectory scratch;
    const auto path = write_text(scratch, "malformed.json", "{ \"model\": ");
    EXPECT_THROW(static_cast<void>(Tessel::Config::load_run_config(path)), std::runtime_error);
}
