#include <arbiter/arbiter.hpp>
#include <iostream>

using namespace arbiter::rule;

// A chain root that proceeds on the seeded "value", followed by a child that declines.
int main() {
    arbiter::core::loadLogLevelFromEnv();

    auto rule1 = makeChainRule<bool>();
    rule1
        ->onEval(hook::boolean([](const RuleView<bool> &view) {
            std::cout << "Eval Chain Rule 1" << std::endl;
            return view.context().mustGet("value");
        }))
        .onPreExecute(hook::effect([](const RuleView<bool> &) { std::cout << "Pre Chain Rule 1" << std::endl; }))
        .onExecute(hook::effect([](const RuleView<bool> &) { std::cout << "Execute Chain Rule 1" << std::endl; }))
        .onPostExecute(hook::effect([](const RuleView<bool> &) { std::cout << "Post Chain Rule 1" << std::endl; }));

    auto rule2 = makeChainRule<bool>();
    rule2
        ->onEval(hook::boolean([](const RuleView<bool> &) {
            std::cout << "Eval Chain Rule 2" << std::endl;
            return false;
        }))
        .onExecute(hook::effect([](const RuleView<bool> &) { std::cout << "Execute Chain Rule 2" << std::endl; }));

    rule1->mustAddChild(std::move(rule2));

    RuleContext<bool> ctx{{"value", true}};
    if (auto error = runChain(&ctx, rule1.get())) {
        std::cerr << "run failed: " << *error << std::endl;
        return 1;
    }
    return 0;
}
