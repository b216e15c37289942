#ifndef USML_RESULT_HPP
#define USML_RESULT_HPP

#include <string>
#include <variant>
#include <optional>

namespace common {

    // Base error type that can be extended
    struct Error {
        std::string message;
        std::optional<std::string> context{std::nullopt};

        Error(const std::string& msg,
              const std::optional<std::string>& ctx = std::nullopt)
            : message(msg), context(ctx) {}

        std::string describe() const {
            if (context) {
                return message + " (" + *context + ")";
            }
            return message;
        }
    };

    // Empty type for operations that only report failure
    struct Success {};

    // Generic result type for operations that can fail
    template<typename T, typename E = Error>
    using Result = std::variant<T, E>;

} // namespace common

#endif // USML_RESULT_HPP
