#pragma once
#include "arbiter/rule/structure/error.hpp"
#include "arbiter/rule/structure/result.hpp"
#include "arbiter/rule/structure/rule.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace arbiter::rule {

    // Fluent tree construction. chain()/bestFirst() open a rule under the one currently open,
    // hooks apply to the innermost open rule, end() closes it.
    template <typename V> class RuleBuilder {
      public:
        using EvalHook = typename Rule<V>::EvalHook;
        using ExecHook = typename Rule<V>::ExecHook;

        RuleBuilder &chain() { return open(RuleType::Chain); }
        RuleBuilder &bestFirst() { return open(RuleType::BestFirst); }

        RuleBuilder &open(RuleType type) {
            push(std::make_unique<Rule<V>>(type));
            return *this;
        }

        RuleBuilder &onEval(EvalHook hook) {
            current("onEval").onEval(std::move(hook));
            return *this;
        }

        RuleBuilder &onPreExecute(ExecHook hook) {
            current("onPreExecute").onPreExecute(std::move(hook));
            return *this;
        }

        RuleBuilder &onExecute(ExecHook hook) {
            current("onExecute").onExecute(std::move(hook));
            return *this;
        }

        RuleBuilder &onPostExecute(ExecHook hook) {
            current("onPostExecute").onPostExecute(std::move(hook));
            return *this;
        }

        RuleBuilder &end() {
            if (stack_.empty()) {
                throw RuleError("Cannot end(): no open rule to close");
            }
            stack_.pop_back();
            return *this;
        }

        RulePtr<V> build() {
            if (!stack_.empty()) {
                throw RuleError("Cannot build rule tree: unbalanced builder, missing end()");
            }
            if (!root_) {
                throw RuleError("Cannot build rule tree: no root rule");
            }
            return std::move(root_);
        }

      private:
        void push(RulePtr<V> node) {
            Rule<V> *raw = node.get();

            if (stack_.empty()) {
                if (root_) {
                    throw RuleError("Cannot open a second root rule");
                }
                root_ = std::move(node);
            } else {
                stack_.back()->mustAddChild(std::move(node));
            }
            stack_.push_back(raw);
        }

        Rule<V> &current(const char *context) {
            if (stack_.empty()) {
                throw RuleError(std::string("Cannot ") + context + "(): no open rule");
            }
            return *stack_.back();
        }

        RulePtr<V> root_;
        std::vector<Rule<V> *> stack_;
    };

} // namespace arbiter::rule
