#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace arbiter::rule {

    enum class ErrorCode {
        NilContext,
        NilNode,
        ChainMultipleChildren,
        ChainMultipleRoots,
        Canceled,
        EvaluationFailed,
        ExecutionFailed,
        InvalidRuleType
    };

    std::string_view toString(ErrorCode code);

    // Runtime outcome of a fire or run. Returned by value, never thrown.
    class Error {
      public:
        Error(ErrorCode code, std::string message, std::optional<std::size_t> index = std::nullopt);

        static Error nilContext();
        static Error nilNode(std::size_t index);
        static Error chainMultipleChildren();
        static Error chainMultipleRoots();
        static Error canceled();
        static Error evaluationFailed(std::string message);
        static Error executionFailed(std::string message);
        static Error invalidRuleType();

        inline ErrorCode code() const { return code_; }
        inline const std::string &message() const { return message_; }
        inline std::optional<std::size_t> index() const { return index_; }

        inline bool is(ErrorCode code) const { return code_ == code; }

        bool operator==(const Error &other) const = default;

      private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::size_t> index_;
    };

    std::ostream &operator<<(std::ostream &os, const Error &error);

    // Thrown for construction mistakes: arity violations inside options and builder misuse.
    class RuleError : public std::logic_error {
      public:
        explicit RuleError(const std::string &what) : std::logic_error(what) {}
        explicit RuleError(const Error &error) : std::logic_error(error.message()) {}
    };

    // Thrown by RuleContext::mustGet when the key is absent.
    class KeyNotFound : public std::out_of_range {
      public:
        explicit KeyNotFound(const std::string &key)
            : std::out_of_range("key '" + key + "' not found in rule context"), key_(key) {}

        inline const std::string &key() const { return key_; }

      private:
        std::string key_;
    };

} // namespace arbiter::rule
