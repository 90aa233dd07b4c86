#pragma once
#include "arbiter/rule/structure/error.hpp"
#include "arbiter/rule/structure/result.hpp"
#include "arbiter/rule/structure/rule.hpp"
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace arbiter::rule {

    // Applied to a freshly constructed rule before it is handed out.
    template <typename V> using Option = std::function<void(Rule<V> &)>;

    template <typename V> Option<V> withEvaluation(typename Rule<V>::EvalHook hook) {
        return [hook = std::move(hook)](Rule<V> &rule) { rule.onEval(hook); };
    }

    template <typename V> Option<V> withPreExecution(typename Rule<V>::ExecHook hook) {
        return [hook = std::move(hook)](Rule<V> &rule) { rule.onPreExecute(hook); };
    }

    template <typename V> Option<V> withExecution(typename Rule<V>::ExecHook hook) {
        return [hook = std::move(hook)](Rule<V> &rule) { rule.onExecute(hook); };
    }

    template <typename V> Option<V> withPostExecution(typename Rule<V>::ExecHook hook) {
        return [hook = std::move(hook)](Rule<V> &rule) { rule.onPostExecute(hook); };
    }

    // Hands the children over on first successful application. Throws RuleError if the rule rejects them,
    // or if a copy of the option is applied again after the children already went to another rule.
    template <typename V, typename... Children> Option<V> withChildren(Children &&...children) {
        struct Pending {
            std::vector<RulePtr<V>> children;
            bool consumed = false;
        };

        auto pending = std::make_shared<Pending>();
        pending->children.reserve(sizeof...(Children));
        (pending->children.push_back(std::forward<Children>(children)), ...);
        return [pending](Rule<V> &rule) {
            if (pending->consumed)
                throw RuleError("withChildren option already applied: its children belong to another rule");
            rule.mustAddChildren(std::move(pending->children));
            pending->consumed = true;
        };
    }

    template <typename V, typename... Options> RulePtr<V> makeRule(RuleType type, Options &&...options) {
        auto rule = std::make_unique<Rule<V>>(type);
        (std::invoke(std::forward<Options>(options), *rule), ...);
        return rule;
    }

    template <typename V, typename... Options> RulePtr<V> makeChainRule(Options &&...options) {
        return makeRule<V>(RuleType::Chain, std::forward<Options>(options)...);
    }

    template <typename V, typename... Options> RulePtr<V> makeBestFirstRule(Options &&...options) {
        return makeRule<V>(RuleType::BestFirst, std::forward<Options>(options)...);
    }

} // namespace arbiter::rule
