#pragma once
#include "error.hpp"
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

namespace arbiter::rule {

    // Traversal strategy carried by every rule and handed to the runner.
    enum class RuleType { Chain, BestFirst };

    std::string_view toString(RuleType type);
    std::ostream &operator<<(std::ostream &os, RuleType type);

    struct EvalResult {
        bool shouldExecute = true;
        std::optional<Error> error;

        static EvalResult proceed() { return EvalResult{true, std::nullopt}; }
        static EvalResult decline() { return EvalResult{false, std::nullopt}; }
        static EvalResult failure(Error error) { return EvalResult{false, std::move(error)}; }
    };

    struct ExecResult {
        std::optional<Error> error;

        static ExecResult ok() { return ExecResult{}; }
        static ExecResult failure(Error error) { return ExecResult{std::move(error)}; }
    };

    // keepGoing tells a best-first runner whether to try the next sibling.
    struct FireResult {
        bool keepGoing = false;
        std::optional<Error> error;

        inline bool ok() const { return !error.has_value(); }
    };

} // namespace arbiter::rule
