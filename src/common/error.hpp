#ifndef TESSEL_COMMON_ERROR_HPP
#define TESSEL_COMMON_ERROR_HPP

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <cstdint>

namespace Tessel {
    // Invalid model or run configuration (non-positive width, dropout outside [0, 1), unknown names).
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Checkpoint file is unreadable or misses a required field.
    class CheckpointFormatError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class ShapeMismatchError : public std::runtime_error {
    public:
        ShapeMismatchError(std::string parameter, std::vector<std::int64_t> expected, std::vector<std::int64_t> found)
            : std::runtime_error(compose(parameter, expected, found)),
              parameter_(std::move(parameter)),
              expected_(std::move(expected)),
              found_(std::move(found))
        {}

        [[nodiscard]] const std::string& parameter() const noexcept { return parameter_; }
        [[nodiscard]] const std::vector<std::int64_t>& expected() const noexcept { return expected_; }
        [[nodiscard]] const std::vector<std::int64_t>& found() const noexcept { return found_; }

        // An empty shape stands for "absent".
        static std::string format_shape(const std::vector<std::int64_t>& shape)
        {
            if (shape.empty()) {
                return "<absent>";
            }
            std::ostringstream stream;
            stream << '[';
            for (std::size_t index = 0; index < shape.size(); ++index) {
                if (index > 0) {
                    stream << ", ";
                }
                stream << shape[index];
            }
            stream << ']';
            return stream.str();
        }

    private:
        static std::string compose(const std::string& parameter,
                                   const std::vector<std::int64_t>& expected,
                                   const std::vector<std::int64_t>& found)
        {
            return "Parameter '" + parameter + "' shape mismatch: expected " + format_shape(expected)
                   + " but found " + format_shape(found) + ".";
        }

        std::string parameter_;
        std::vector<std::int64_t> expected_;
        std::vector<std::int64_t> found_;
    };
}

#endif // TESSEL_COMMON_ERROR_HPP
