#pragma once
#include "arbiter/rule/structure/result.hpp"
#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

// Adapters from plain callables to the single hook signature rules store.
// Each returns a generic callable that binds to Rule<V>::EvalHook or Rule<V>::ExecHook for any V.
namespace arbiter::rule::hook {

    // Evaluation from a predicate: true proceeds, false declines. Never reports an error.
    // The predicate must return something implicitly convertible to bool, so an std::optional<bool>
    // read straight from the context does not bind.
    template <typename F> auto boolean(F func) {
        return [func = std::move(func)](const auto &view) -> EvalResult
                   requires std::convertible_to<std::invoke_result_t<const F &, decltype(view)>, bool>
        {
            const bool proceed = func(view);
            return EvalResult{proceed, std::nullopt};
        };
    }

    // Evaluation or execution step that reports its own EvalResult or ExecResult.
    template <typename F> auto detailed(F func) {
        return [func = std::move(func)](const auto &view) {
            using Result = std::invoke_result_t<const F &, decltype(view)>;
            static_assert(std::is_same_v<Result, EvalResult> || std::is_same_v<Result, ExecResult>,
                          "detailed hooks must return EvalResult or ExecResult");
            return func(view);
        };
    }

    // Execution step with no failure mode.
    template <typename F> auto effect(F func) {
        return [func = std::move(func)](const auto &view) -> ExecResult {
            func(view);
            return ExecResult{};
        };
    }

} // namespace arbiter::rule::hook
