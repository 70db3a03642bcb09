#ifndef TESSEL_COMMON_CHECKPOINT_HPP
#define TESSEL_COMMON_CHECKPOINT_HPP
/*
 * Checkpoint file: a single LibTorch serialize archive.
 *
 *   version        int       (written as 1, optional on read)
 *   input_size     int
 *   output_size    int
 *   hidden_layers  int list
 *   dropout        double    (optional on read, default 0.5)
 *   activation     string    (optional on read, default "relu")
 *   state_dict     nested archive, one entry per parameter (fc_<i>.weight, fc_<i>.bias)
 *
 * Writes go to "<path>.tmp" and are renamed over <path>.
 */

#include <cstdint>
#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>
#include <torch/serialize/input-archive.h>
#include <torch/serialize/output-archive.h>

#include "../activation/activation.hpp"
#include "../core.hpp"
#include "error.hpp"

namespace Tessel::Checkpoint {
    inline constexpr std::int64_t kFormatVersion = 1;

    struct Record {
        ModelConfig config{};
        std::int64_t version{kFormatVersion};
    };

    namespace Detail {
        [[nodiscard]] inline std::vector<std::int64_t> shape_of(const torch::Tensor& tensor)
        {
            return tensor.sizes().vec();
        }

        inline void open_archive(torch::serialize::InputArchive& archive, const std::filesystem::path& path)
        {
            if (!std::filesystem::exists(path)) {
                throw std::runtime_error("Checkpoint not found at '" + path.string() + "'.");
            }
            try {
                archive.load_from(path.string());
            } catch (const c10::Error& error) {
                throw CheckpointFormatError("Failed to open checkpoint '" + path.string() + "': " + error.what_without_backtrace());
            }
        }

        [[nodiscard]] inline c10::IValue read_field(torch::serialize::InputArchive& archive,
                                                    const std::string& key,
                                                    const std::filesystem::path& path)
        {
            c10::IValue value;
            if (!archive.try_read(key, value)) {
                throw CheckpointFormatError("Checkpoint '" + path.string() + "' is missing the '" + key + "' entry.");
            }
            return value;
        }

        [[nodiscard]] inline std::int64_t read_int(torch::serialize::InputArchive& archive,
                                                   const std::string& key,
                                                   const std::filesystem::path& path)
        {
            const auto value = read_field(archive, key, path);
            if (!value.isInt()) {
                throw CheckpointFormatError("Checkpoint '" + path.string() + "' field '" + key + "' must be an integer.");
            }
            return value.toInt();
        }

        // Walks "fc_0.weight" through the nested archives written by torch::nn::Module::save.
        [[nodiscard]] inline bool try_read_nested_tensor(torch::serialize::InputArchive& root,
                                                         const std::string& dotted_key,
                                                         torch::Tensor& tensor)
        {
            std::vector<std::string> parts;
            std::stringstream stream(dotted_key);
            std::string part;
            while (std::getline(stream, part, '.')) {
                parts.push_back(part);
            }
            if (parts.empty()) {
                return false;
            }

            // InputArchive is move-only; keep each level alive while descending.
            std::vector<std::unique_ptr<torch::serialize::InputArchive>> levels;
            torch::serialize::InputArchive* current = &root;
            for (std::size_t index = 0; index + 1 < parts.size(); ++index) {
                auto child = std::make_unique<torch::serialize::InputArchive>();
                if (!current->try_read(parts[index], *child)) {
                    return false;
                }
                current = child.get();
                levels.push_back(std::move(child));
            }
            return current->try_read(parts.back(), tensor);
        }

        [[nodiscard]] inline Record read_record(torch::serialize::InputArchive& archive, const std::filesystem::path& path)
        {
            Record record{};
            record.config.input_size = read_int(archive, "input_size", path);
            record.config.output_size = read_int(archive, "output_size", path);

            const auto hidden = read_field(archive, "hidden_layers", path);
            if (!hidden.isIntList()) {
                throw CheckpointFormatError("Checkpoint '" + path.string() + "' field 'hidden_layers' must be a list of integers.");
            }
            record.config.hidden_layers = hidden.toIntVector();

            c10::IValue optional_value;
            if (archive.try_read("version", optional_value)) {
                if (!optional_value.isInt()) {
                    throw CheckpointFormatError("Checkpoint '" + path.string() + "' field 'version' must be an integer.");
                }
                record.version = optional_value.toInt();
                if (record.version > kFormatVersion) {
                    throw CheckpointFormatError("Checkpoint '" + path.string() + "' uses format version "
                                                + std::to_string(record.version) + "; newest supported is "
                                                + std::to_string(kFormatVersion) + ".");
                }
            }
            if (archive.try_read("dropout", optional_value)) {
                if (!optional_value.isDouble()) {
                    throw CheckpointFormatError("Checkpoint '" + path.string() + "' field 'dropout' must be a floating point value.");
                }
                record.config.dropout = optional_value.toDouble();
            }
            if (archive.try_read("activation", optional_value)) {
                if (!optional_value.isString()) {
                    throw CheckpointFormatError("Checkpoint '" + path.string() + "' field 'activation' must be a string.");
                }
                try {
                    record.config.activation = Activation::Descriptor{Activation::from_string(optional_value.toStringRef())};
                } catch (const ConfigurationError& error) {
                    throw CheckpointFormatError("Checkpoint '" + path.string() + "': " + error.what());
                }
            }

            torch::serialize::InputArchive state;
            if (!archive.try_read("state_dict", state)) {
                throw CheckpointFormatError("Checkpoint '" + path.string() + "' is missing the 'state_dict' entry.");
            }

            try {
                record.config.validate();
            } catch (const ConfigurationError& error) {
                throw CheckpointFormatError("Checkpoint '" + path.string() + "' describes an invalid model: " + error.what());
            }
            return record;
        }

        inline void restore(torch::serialize::InputArchive& archive,
                            const Record& record,
                            Model& model,
                            const std::filesystem::path& path)
        {
            auto parameters = model.named_parameters(/*recurse=*/true);

            // The shapes implied by the stored configuration must match the target model one for one.
            std::unordered_map<std::string, std::vector<std::int64_t>> implied;
            for (const auto& [name, shape] : record.config.parameter_shapes()) {
                implied.emplace(name, shape);
            }
            for (const auto& item : parameters) {
                const auto it = implied.find(item.key());
                if (it == implied.end()) {
                    throw ShapeMismatchError(item.key(), shape_of(item.value()), {});
                }
                if (it->second != shape_of(item.value())) {
                    throw ShapeMismatchError(item.key(), shape_of(item.value()), it->second);
                }
                implied.erase(it);
            }
            if (!implied.empty()) {
                const auto& [name, shape] = *implied.begin();
                throw ShapeMismatchError(name, {}, shape);
            }

            torch::serialize::InputArchive state;
            if (!archive.try_read("state_dict", state)) {
                throw CheckpointFormatError("Checkpoint '" + path.string() + "' is missing the 'state_dict' entry.");
            }

            std::vector<torch::Tensor> stored_values;
            stored_values.reserve(parameters.size());
            for (const auto& item : parameters) {
                torch::Tensor stored;
                bool found = false;
                try {
                    found = try_read_nested_tensor(state, item.key(), stored);
                } catch (const c10::Error& error) {
                    throw CheckpointFormatError("Checkpoint parameter '" + item.key() + "' is unreadable: "
                                                + error.what_without_backtrace());
                }
                if (!found || !stored.defined()) {
                    throw CheckpointFormatError("Checkpoint '" + path.string() + "' is missing parameter '" + item.key() + "'.");
                }
                if (stored.sizes() != item.value().sizes()) {
                    throw ShapeMismatchError(item.key(), shape_of(item.value()), shape_of(stored));
                }
                stored_values.push_back(std::move(stored));
            }

            torch::NoGradGuard no_grad{};
            for (std::size_t index = 0; index < parameters.size(); ++index) {
                parameters[index].value().copy_(stored_values[index]);
            }
        }
    }

    inline void save(const Model& model, const std::filesystem::path& path)
    {
        namespace fs = std::filesystem;
        if (path.empty()) {
            throw std::invalid_argument("Checkpoint::save requires a non-empty path.");
        }
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        const auto& config = model.config();
        c10::List<std::int64_t> hidden_layers;
        hidden_layers.reserve(config.hidden_layers.size());
        for (const auto width : config.hidden_layers) {
            hidden_layers.push_back(width);
        }

        torch::serialize::OutputArchive archive;
        archive.write("version", c10::IValue(kFormatVersion));
        archive.write("input_size", c10::IValue(config.input_size));
        archive.write("output_size", c10::IValue(config.output_size));
        archive.write("hidden_layers", c10::IValue(std::move(hidden_layers)));
        archive.write("dropout", c10::IValue(config.dropout));
        archive.write("activation", c10::IValue(Activation::to_string(config.activation.type)));

        torch::serialize::OutputArchive state;
        model.torch::nn::Module::save(state);
        archive.write("state_dict", state);

        auto staging = path;
        staging += ".tmp";
        try {
            archive.save_to(staging.string());
        } catch (const c10::Error& error) {
            std::error_code ignored;
            fs::remove(staging, ignored);
            throw std::runtime_error("Failed to write checkpoint to '" + staging.string() + "': " + error.what_without_backtrace());
        }

        std::error_code rename_error;
        fs::rename(staging, path, rename_error);
        if (rename_error) {
            std::error_code ignored;
            fs::remove(staging, ignored);
            throw std::runtime_error("Failed to move checkpoint into place at '" + path.string() + "': " + rename_error.message());
        }
    }

    [[nodiscard]] inline Record read_record(const std::filesystem::path& path)
    {
        torch::serialize::InputArchive archive;
        Detail::open_archive(archive, path);
        return Detail::read_record(archive, path);
    }

    // Loads stored parameters into an existing model of the same architecture.
    inline void restore(const std::filesystem::path& path, Model& model)
    {
        torch::serialize::InputArchive archive;
        Detail::open_archive(archive, path);
        const auto record = Detail::read_record(archive, path);
        Detail::restore(archive, record, model, path);
    }

    [[nodiscard]] inline std::shared_ptr<Model> load(const std::filesystem::path& path)
    {
        torch::serialize::InputArchive archive;
        Detail::open_archive(archive, path);
        const auto record = Detail::read_record(archive, path);
        auto model = std::make_shared<Model>(record.config);
        Detail::restore(archive, record, *model, path);
        return model;
    }
}

#endif // TESSEL_COMMON_CHECKPOINT_HPP
