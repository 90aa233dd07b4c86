#include "arbiter/rule/structure/error.hpp"
#include <utility>

namespace arbiter::rule {

    std::string_view toString(ErrorCode code) {
        switch (code) {
        case ErrorCode::NilContext:
            return "NilContext";
        case ErrorCode::NilNode:
            return "NilNode";
        case ErrorCode::ChainMultipleChildren:
            return "ChainMultipleChildren";
        case ErrorCode::ChainMultipleRoots:
            return "ChainMultipleRoots";
        case ErrorCode::Canceled:
            return "Canceled";
        case ErrorCode::EvaluationFailed:
            return "EvaluationFailed";
        case ErrorCode::ExecutionFailed:
            return "ExecutionFailed";
        case ErrorCode::InvalidRuleType:
            return "InvalidRuleType";
        }
        return "Unknown";
    }

    Error::Error(ErrorCode code, std::string message, std::optional<std::size_t> index)
        : code_(code), message_(std::move(message)), index_(index) {}

    Error Error::nilContext() { return Error(ErrorCode::NilContext, "rule context cannot be null"); }

    Error Error::nilNode(std::size_t index) {
        return Error(ErrorCode::NilNode, "rule at index " + std::to_string(index) + " is null", index);
    }

    Error Error::chainMultipleChildren() {
        return Error(ErrorCode::ChainMultipleChildren, "chain rule can only have one child");
    }

    Error Error::chainMultipleRoots() {
        return Error(ErrorCode::ChainMultipleRoots, "chain rule runner only supports one rule");
    }

    Error Error::canceled() { return Error(ErrorCode::Canceled, "rule execution canceled"); }

    Error Error::evaluationFailed(std::string message) {
        return Error(ErrorCode::EvaluationFailed, std::move(message));
    }

    Error Error::executionFailed(std::string message) { return Error(ErrorCode::ExecutionFailed, std::move(message)); }

    Error Error::invalidRuleType() { return Error(ErrorCode::InvalidRuleType, "invalid rule type"); }

    std::ostream &operator<<(std::ostream &os, const Error &error) {
        return os << toString(error.code()) << ": " << error.message();
    }

} // namespace arbiter::rule
