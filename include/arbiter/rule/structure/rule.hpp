#pragma once
#include "arbiter/core/log.hpp"
#include "context.hpp"
#include "error.hpp"
#include "result.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace arbiter::rule {

    template <typename V> class Rule;
    template <typename V> using RulePtr = std::unique_ptr<Rule<V>>;

    namespace detail {
        // Defined in runner.hpp. Runs a batch of rules under one strategy.
        template <typename V, typename Range>
        std::optional<Error> dispatch(RuleType type, const std::stop_token &stopToken, RuleContext<V> *context,
                                      const Range &rules);
    } // namespace detail

    // What a hook sees of the rule being fired.
    template <typename V> class RuleView {
      public:
        RuleView(RuleContext<V> &context, std::stop_token stopToken, RuleType type)
            : context_(context), stopToken_(std::move(stopToken)), type_(type) {}

        inline RuleContext<V> &context() const { return context_; }
        inline const std::stop_token &stopToken() const { return stopToken_; }
        inline bool stopRequested() const { return stopToken_.stop_requested(); }
        inline RuleType type() const { return type_; }

      private:
        RuleContext<V> &context_;
        std::stop_token stopToken_;
        RuleType type_;
    };

    // A decision node. Owns its children; borrows the context and stop token bound for the current fire.
    template <typename V> class Rule {
      public:
        using View = RuleView<V>;
        using EvalHook = std::function<EvalResult(const View &)>;
        using ExecHook = std::function<ExecResult(const View &)>;

        explicit Rule(RuleType type) : type_(type) {}

        Rule(const Rule &) = delete;
        Rule &operator=(const Rule &) = delete;

        inline Rule &onEval(EvalHook hook) {
            onEval_ = std::move(hook);
            return *this;
        }

        inline Rule &onPreExecute(ExecHook hook) {
            onPreExecute_ = std::move(hook);
            return *this;
        }

        inline Rule &onExecute(ExecHook hook) {
            onExecute_ = std::move(hook);
            return *this;
        }

        inline Rule &onPostExecute(ExecHook hook) {
            onPostExecute_ = std::move(hook);
            return *this;
        }

        // On rejection neither this rule nor `child` is touched.
        std::optional<Error> addChild(RulePtr<V> &&child) {
            if (type_ == RuleType::Chain && !children_.empty())
                return Error::chainMultipleChildren();
            if (!child)
                return Error::nilNode(0);
            children_.push_back(std::move(child));
            return std::nullopt;
        }

        // All or nothing. The vector is left empty on success and untouched on rejection.
        std::optional<Error> addChildren(std::vector<RulePtr<V>> &&children) {
            if (type_ == RuleType::Chain && children_.size() + children.size() > 1)
                return Error::chainMultipleChildren();
            for (std::size_t i = 0; i < children.size(); ++i) {
                if (!children[i])
                    return Error::nilNode(i);
            }
            for (auto &child : children) {
                children_.push_back(std::move(child));
            }
            children.clear();
            return std::nullopt;
        }

        // Throwing variants for build time, where a rejected child is a programming mistake.
        Rule &mustAddChild(RulePtr<V> &&child) {
            if (auto error = addChild(std::move(child)))
                throw RuleError(*error);
            return *this;
        }

        Rule &mustAddChildren(std::vector<RulePtr<V>> &&children) {
            if (auto error = addChildren(std::move(children)))
                throw RuleError(*error);
            return *this;
        }

        inline const std::vector<RulePtr<V>> &children() const { return children_; }
        inline bool hasChildren() const { return !children_.empty(); }
        inline std::size_t childrenCount() const { return children_.size(); }
        inline RuleType type() const { return type_; }

        // A runner binds a rule only for the duration of its fire. A host calling fire() directly binds first.
        inline void bind(RuleContext<V> *context, std::stop_token stopToken) {
            context_ = context;
            stopToken_ = std::move(stopToken);
        }

        inline RuleContext<V> *context() const { return context_; }
        inline const std::stop_token &stopToken() const { return stopToken_; }

        // Evaluate, then pre-execute, execute and post-execute, then run the children under this rule's
        // strategy. The first error stops everything after it.
        FireResult fire() {
            if (stopToken_.stop_requested()) {
                ARBITER_LOG_TRACE("{}: canceled before evaluation", arbiter::rule::toString(type_));
                return {false, Error::canceled()};
            }
            if (!context_)
                return {false, Error::nilContext()};
            if (type_ != RuleType::Chain && type_ != RuleType::BestFirst)
                return {false, Error::invalidRuleType()};

            const View view(*context_, stopToken_, type_);

            EvalResult evaluation = onEval_ ? onEval_(view) : EvalResult::proceed();
            if (evaluation.error)
                return {false, std::move(evaluation.error)};
            if (!evaluation.shouldExecute) {
                ARBITER_LOG_TRACE("{}: skipped", arbiter::rule::toString(type_));
                return {true, std::nullopt};
            }

            for (const ExecHook *stage : {&onPreExecute_, &onExecute_, &onPostExecute_}) {
                if (!*stage)
                    continue;
                ExecResult result = (*stage)(view);
                if (result.error)
                    return {false, std::move(result.error)};
            }
            ARBITER_LOG_TRACE("{}: executed, {} child rule(s) next", arbiter::rule::toString(type_),
                              children_.size());

            if (auto error = detail::dispatch(type_, stopToken_, context_, children_))
                return {false, std::move(error)};

            // A best-first rule that executed has satisfied its search.
            return {type_ == RuleType::Chain, std::nullopt};
        }

        std::string toString() const {
            return "Rule{type: " + std::string(arbiter::rule::toString(type_)) +
                   ", children: " + std::to_string(children_.size()) + "}";
        }

      private:
        RuleType type_;
        std::vector<RulePtr<V>> children_;
        EvalHook onEval_;
        ExecHook onPreExecute_;
        ExecHook onExecute_;
        ExecHook onPostExecute_;
        RuleContext<V> *context_ = nullptr;
        std::stop_token stopToken_;
    };

    template <typename V> std::ostream &operator<<(std::ostream &os, const Rule<V> &rule) {
        return os << rule.toString();
    }

} // namespace arbiter::rule

// fire() recurses through the runner; keep both visible wherever a rule is.
#include "arbiter/rule/runner.hpp"
