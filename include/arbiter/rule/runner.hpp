#pragma once
#include "arbiter/core/log.hpp"
#include "arbiter/rule/structure/context.hpp"
#include "arbiter/rule/structure/error.hpp"
#include "arbiter/rule/structure/result.hpp"
#include "arbiter/rule/structure/rule.hpp"
#include <array>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <stop_token>
#include <type_traits>

namespace arbiter::rule {

    namespace detail {

        // Binds a rule for one fire and releases it again on the way out, exceptions included.
        template <typename V> class ScopedBinding {
          public:
            ScopedBinding(Rule<V> &rule, RuleContext<V> *context, const std::stop_token &stopToken) : rule_(rule) {
                rule_.bind(context, stopToken);
            }
            ~ScopedBinding() { rule_.bind(nullptr, std::stop_token{}); }

            ScopedBinding(const ScopedBinding &) = delete;
            ScopedBinding &operator=(const ScopedBinding &) = delete;

          private:
            Rule<V> &rule_;
        };

        // `rules` holds raw or owning pointers to Rule<V>. Validates the batch before firing anything.
        template <typename V, typename Range>
        std::optional<Error> dispatch(RuleType type, const std::stop_token &stopToken, RuleContext<V> *context,
                                      const Range &rules) {
            if (!context)
                return Error::nilContext();
            if (std::ranges::empty(rules))
                return std::nullopt;

            std::size_t index = 0;
            for (const auto &rule : rules) {
                if (!rule)
                    return Error::nilNode(index);
                ++index;
            }

            switch (type) {
            case RuleType::Chain: {
                if (std::ranges::size(rules) > 1)
                    return Error::chainMultipleRoots();

                Rule<V> &rule = **std::ranges::begin(rules);
                ScopedBinding<V> binding(rule, context, stopToken);
                return rule.fire().error;
            }
            case RuleType::BestFirst: {
                for (const auto &entry : rules) {
                    Rule<V> &rule = *entry;
                    ScopedBinding<V> binding(rule, context, stopToken);
                    FireResult result = rule.fire();
                    if (result.error)
                        return std::move(result.error);
                    if (!result.keepGoing)
                        break;
                }
                return std::nullopt;
            }
            }
            return Error::invalidRuleType();
        }

    } // namespace detail

    // Fires `rules` under `type`. Chain takes exactly one root; BestFirst tries them in order and stops at
    // the first one that executes. A null context or rule is reported before any rule fires.
    template <typename V>
    std::optional<Error> run(RuleType type, std::stop_token stopToken, RuleContext<V> *context,
                             std::type_identity_t<std::span<Rule<V> *const>> rules) {
        ARBITER_LOG_DEBUG("run {} with {} root rule(s)", toString(type), rules.size());
        auto error = detail::dispatch(type, stopToken, context, rules);
        if (error) {
            ARBITER_LOG_DEBUG("run {} failed: {}", toString(type), error->message());
        }
        return error;
    }

    template <typename V, typename... Rules>
        requires(std::convertible_to<Rules, Rule<V> *> && ...)
    std::optional<Error> run(RuleType type, std::stop_token stopToken, RuleContext<V> *context, Rules... rules) {
        std::array<Rule<V> *, sizeof...(Rules)> batch{static_cast<Rule<V> *>(rules)...};
        return run<V>(type, std::move(stopToken), context, std::span<Rule<V> *const>(batch));
    }

    template <typename V, typename... Rules>
        requires(std::convertible_to<Rules, Rule<V> *> && ...)
    std::optional<Error> runChain(RuleContext<V> *context, Rules... rules) {
        return run<V>(RuleType::Chain, std::stop_token{}, context, rules...);
    }

    template <typename V, typename... Rules>
        requires(std::convertible_to<Rules, Rule<V> *> && ...)
    std::optional<Error> runChain(std::stop_token stopToken, RuleContext<V> *context, Rules... rules) {
        return run<V>(RuleType::Chain, std::move(stopToken), context, rules...);
    }

    template <typename V, typename... Rules>
        requires(std::convertible_to<Rules, Rule<V> *> && ...)
    std::optional<Error> runBestFirst(RuleContext<V> *context, Rules... rules) {
        return run<V>(RuleType::BestFirst, std::stop_token{}, context, rules...);
    }

    template <typename V, typename... Rules>
        requires(std::convertible_to<Rules, Rule<V> *> && ...)
    std::optional<Error> runBestFirst(std::stop_token stopToken, RuleContext<V> *context, Rules... rules) {
        return run<V>(RuleType::BestFirst, std::move(stopToken), context, rules...);
    }

} // namespace arbiter::rule
