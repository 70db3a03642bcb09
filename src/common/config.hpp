#ifndef TESSEL_COMMON_CONFIG_HPP
#define TESSEL_COMMON_CONFIG_HPP
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../activation/activation.hpp"
#include "../core.hpp"
#include "../loss/loss.hpp"
#include "../optimizer/optimizer.hpp"
#include "error.hpp"

namespace Tessel::Config {
    using PropertyTree = boost::property_tree::ptree;

    /*
     * {
     *   "dataset":    {"name": "fashion_mnist", "root": "...", "train_fraction": 1.0, "test_fraction": 1.0},
     *   "model":      {"input_size": 784, "output_size": 10, "hidden_layers": [512, 256, 128],
     *                  "dropout": 0.2, "activation": "relu"},
     *   "optimizer":  {"type": "adam", "learning_rate": 0.001, ...},
     *   "loss":       {"reduction": "mean", "weight": [...], "ignore_index": -1},
     *   "training":   {"epochs": 2, "batch_size": 64, "shuffle": true, "print_every": 40,
     *                  "restore_best_state": false},
     *   "checkpoint": "checkpoint.pt"
     * }
     */
    struct RunConfig {
        std::string dataset{"mnist"};
        std::string dataset_root{"./data"};
        float train_fraction{1.0f};
        float test_fraction{1.0f};
        ModelConfig model{};
        Optimizer::Descriptor optimizer{Optimizer::Adam()};
        Loss::NegativeLogLikelihoodDescriptor loss{Loss::NegativeLogLikelihood()};
        std::size_t epochs{2};
        std::size_t batch_size{64};
        bool shuffle{true};
        std::size_t print_every{40};
        bool restore_best_state{false};
        std::string checkpoint{"checkpoint.pt"};
    };

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw ConfigurationError(message.str());
            }
            return *value;
        }

        template <class Numeric>
        Numeric get_numeric_or(const PropertyTree& tree, const std::string& key, Numeric fallback, const std::string& context)
        {
            if (!tree.get_child_optional(key)) {
                return fallback;
            }
            return get_numeric<Numeric>(tree, key, context);
        }

        inline std::size_t get_count_or(const PropertyTree& tree, const std::string& key, std::size_t fallback, const std::string& context)
        {
            const auto value = get_numeric_or<std::int64_t>(tree, key, static_cast<std::int64_t>(fallback), context);
            if (value < 0) {
                throw ConfigurationError("Field '" + key + "' in " + context + " must not be negative.");
            }
            return static_cast<std::size_t>(value);
        }

        inline bool get_boolean_or(const PropertyTree& tree, const std::string& key, bool fallback, const std::string& context)
        {
            if (!tree.get_child_optional(key)) {
                return fallback;
            }
            const auto value = tree.get_optional<bool>(key);
            if (!value) {
                std::ostringstream message;
                message << "Invalid boolean field '" << key << "' in " << context;
                throw ConfigurationError(message.str());
            }
            return *value;
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                try {
                    values.push_back(child.second.get_value<T>());
                } catch (const boost::property_tree::ptree_bad_data&) {
                    std::ostringstream message;
                    message << "Invalid array element in " << context;
                    throw ConfigurationError(message.str());
                }
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
        }

        inline ModelConfig read_model(const PropertyTree& tree)
        {
            const std::string context = "model configuration";
            ModelConfig config{};
            config.input_size = get_numeric<std::int64_t>(tree, "input_size", context);
            config.output_size = get_numeric<std::int64_t>(tree, "output_size", context);

            const auto hidden = tree.get_child_optional("hidden_layers");
            if (!hidden) {
                throw ConfigurationError("Missing array field 'hidden_layers' in " + context);
            }
            config.hidden_layers = read_array<std::int64_t>(*hidden, context + " hidden_layers");
            config.dropout = get_numeric_or<double>(tree, "dropout", config.dropout, context);
            if (const auto activation = tree.get_optional<std::string>("activation")) {
                config.activation = Activation::Descriptor{Activation::from_string(to_lower(*activation))};
            }
            config.validate();
            return config;
        }

        inline PropertyTree write_model(const ModelConfig& config)
        {
            PropertyTree tree;
            tree.put("input_size", config.input_size);
            tree.put("output_size", config.output_size);
            tree.add_child("hidden_layers", write_array(config.hidden_layers));
            tree.put("dropout", config.dropout);
            tree.put("activation", Activation::to_string(config.activation.type));
            return tree;
        }

        inline Optimizer::Descriptor read_optimizer(const PropertyTree& tree)
        {
            const std::string context = "optimizer configuration";
            const auto type = to_lower(tree.get<std::string>("type", std::string("adam")));

            if (type == "sgd") {
                Optimizer::SGDOptions options{};
                options.learning_rate = get_numeric_or(tree, "learning_rate", options.learning_rate, context);
                options.momentum = get_numeric_or(tree, "momentum", options.momentum, context);
                options.dampening = get_numeric_or(tree, "dampening", options.dampening, context);
                options.weight_decay = get_numeric_or(tree, "weight_decay", options.weight_decay, context);
                options.nesterov = get_boolean_or(tree, "nesterov", options.nesterov, context);
                return Optimizer::SGD(options);
            }

            const auto read_adam_family = [&](auto options) {
                options.learning_rate = get_numeric_or(tree, "learning_rate", options.learning_rate, context);
                options.beta1 = get_numeric_or(tree, "beta1", options.beta1, context);
                options.beta2 = get_numeric_or(tree, "beta2", options.beta2, context);
                options.eps = get_numeric_or(tree, "eps", options.eps, context);
                options.weight_decay = get_numeric_or(tree, "weight_decay", options.weight_decay, context);
                options.amsgrad = get_boolean_or(tree, "amsgrad", options.amsgrad, context);
                return options;
            };

            if (type == "adam") {
                return Optimizer::Adam(read_adam_family(Optimizer::AdamOptions{}));
            }
            if (type == "adamw") {
                return Optimizer::AdamW(read_adam_family(Optimizer::AdamWOptions{}));
            }
            throw ConfigurationError("Unknown optimizer type '" + type + "' (expected sgd, adam or adamw).");
        }

        inline Loss::NegativeLogLikelihoodDescriptor read_loss(const PropertyTree& tree)
        {
            const std::string context = "loss configuration";
            Loss::NegativeLogLikelihoodOptions options{};
            if (const auto reduction = tree.get_optional<std::string>("reduction")) {
                options.reduction = Loss::Details::reduction_from_string(to_lower(*reduction));
            }
            if (const auto weight = tree.get_child_optional("weight")) {
                options.weight = read_array<double>(*weight, context + " weight");
            }
            if (tree.get_child_optional("ignore_index")) {
                options.ignore_index = get_numeric<std::int64_t>(tree, "ignore_index", context);
            }
            return Loss::NegativeLogLikelihood(options);
        }

        inline PropertyTree write_loss(const Loss::NegativeLogLikelihoodDescriptor& descriptor)
        {
            PropertyTree tree;
            tree.put("reduction", Loss::Details::to_string(descriptor.options.reduction));
            if (!descriptor.options.weight.empty()) {
                tree.add_child("weight", write_array(descriptor.options.weight));
            }
            if (descriptor.options.ignore_index) {
                tree.put("ignore_index", *descriptor.options.ignore_index);
            }
            return tree;
        }

        inline PropertyTree write_optimizer(const Optimizer::Descriptor& descriptor)
        {
            PropertyTree tree;
            std::visit([&](const auto& concrete) {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                const auto& options = concrete.options;
                tree.put("learning_rate", options.learning_rate);
                tree.put("weight_decay", options.weight_decay);
                if constexpr (std::is_same_v<DescriptorType, Optimizer::SGDDescriptor>) {
                    tree.put("type", "sgd");
                    tree.put("momentum", options.momentum);
                    tree.put("dampening", options.dampening);
                    tree.put("nesterov", options.nesterov);
                } else {
                    tree.put("type", std::is_same_v<DescriptorType, Optimizer::AdamDescriptor> ? "adam" : "adamw");
                    tree.put("beta1", options.beta1);
                    tree.put("beta2", options.beta2);
                    tree.put("eps", options.eps);
                    tree.put("amsgrad", options.amsgrad);
                }
            }, descriptor);
            return tree;
        }
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to read configuration '" + path.string() + "': " + error.what());
        }
        return tree;
    }

    [[nodiscard]] inline RunConfig parse_run_config(const PropertyTree& tree)
    {
        RunConfig config{};

        const auto model = tree.get_child_optional("model");
        if (!model) {
            throw ConfigurationError("Run configuration is missing the 'model' section.");
        }
        config.model = Detail::read_model(*model);

        if (const auto dataset = tree.get_child_optional("dataset")) {
            const std::string context = "dataset configuration";
            config.dataset = Detail::to_lower(dataset->get<std::string>("name", config.dataset));
            config.dataset_root = dataset->get<std::string>("root", config.dataset_root);
            config.train_fraction = Detail::get_numeric_or(*dataset, "train_fraction", config.train_fraction, context);
            config.test_fraction = Detail::get_numeric_or(*dataset, "test_fraction", config.test_fraction, context);
        }
        if (config.dataset != "mnist" && config.dataset != "fashion_mnist") {
            throw ConfigurationError("Unknown dataset '" + config.dataset + "' (expected mnist or fashion_mnist).");
        }

        if (const auto optimizer = tree.get_child_optional("optimizer")) {
            config.optimizer = Detail::read_optimizer(*optimizer);
        }

        if (const auto loss = tree.get_child_optional("loss")) {
            config.loss = Detail::read_loss(*loss);
        }

        if (const auto training = tree.get_child_optional("training")) {
            const std::string context = "training configuration";
            config.epochs = Detail::get_count_or(*training, "epochs", config.epochs, context);
            config.batch_size = Detail::get_count_or(*training, "batch_size", config.batch_size, context);
            config.shuffle = Detail::get_boolean_or(*training, "shuffle", config.shuffle, context);
            config.print_every = Detail::get_count_or(*training, "print_every", config.print_every, context);
            config.restore_best_state = Detail::get_boolean_or(*training, "restore_best_state", config.restore_best_state, context);
        }
        if (config.batch_size == 0) {
            throw ConfigurationError("Training batch size must be positive.");
        }

        config.checkpoint = tree.get<std::string>("checkpoint", config.checkpoint);
        return config;
    }

    [[nodiscard]] inline PropertyTree to_property_tree(const RunConfig& config)
    {
        PropertyTree tree;

        PropertyTree dataset;
        dataset.put("name", config.dataset);
        dataset.put("root", config.dataset_root);
        dataset.put("train_fraction", config.train_fraction);
        dataset.put("test_fraction", config.test_fraction);
        tree.add_child("dataset", dataset);

        tree.add_child("model", Detail::write_model(config.model));
        tree.add_child("optimizer", Detail::write_optimizer(config.optimizer));
        tree.add_child("loss", Detail::write_loss(config.loss));

        PropertyTree training;
        training.put("epochs", config.epochs);
        training.put("batch_size", config.batch_size);
        training.put("shuffle", config.shuffle);
        training.put("print_every", config.print_every);
        training.put("restore_best_state", config.restore_best_state);
        tree.add_child("training", training);

        tree.put("checkpoint", config.checkpoint);
        return tree;
    }

    [[nodiscard]] inline RunConfig load_run_config(const std::filesystem::path& path)
    {
        return parse_run_config(read_json_file(path));
    }

    inline void save_run_config(const RunConfig& config, const std::filesystem::path& path)
    {
        write_json_file(path, to_property_tree(config));
    }

    [[nodiscard]] inline TrainOptions train_options(const RunConfig& config)
    {
        TrainOptions options{};
        options.epoch = config.epochs;
        options.batch_size = config.batch_size;
        options.shuffle = config.shuffle;
        options.print_every = config.print_every;
        options.restore_best_state = config.restore_best_state;
        return options;
    }
}

#endif // TESSEL_COMMON_CONFIG_HPP
