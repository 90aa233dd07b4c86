#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <algorithm>
#include <arbiter/arbiter.hpp>
#include <doctest/doctest.h>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

using namespace arbiter::rule;

namespace {

    RulePtr<int> counter(RuleType type, const std::string &key, bool proceed = true) {
        return makeRule<int>(type,
                             withEvaluation<int>(hook::boolean([proceed](const RuleView<int> &) { return proceed; })),
                             withExecution<int>(hook::effect([key](const RuleView<int> &view) {
                                 auto &ctx = view.context();
                                 ctx.set(key, ctx.get(key).value_or(0) + 1);
                             })));
    }

} // namespace

TEST_CASE("Runner validation") {
    RuleContext<int> ctx;

    SUBCASE("Null context") {
        auto rule = counter(RuleType::Chain, "hits");
        auto error = run<int>(RuleType::Chain, {}, nullptr, rule.get());
        REQUIRE(error.has_value());
        CHECK(error->code() == ErrorCode::NilContext);

        error = runBestFirst<int>(nullptr, rule.get());
        REQUIRE(error.has_value());
        CHECK(error->code() == ErrorCode::NilContext);
    }

    SUBCASE("Null rule reports its index and fires nothing") {
        auto rule = counter(RuleType::BestFirst, "hits");
        auto error = runBestFirst(&ctx, rule.get(), static_cast<Rule<int> *>(nullptr));
        REQUIRE(error.has_value());
        CHECK(error->code() == ErrorCode::NilNode);
        CHECK(error->index() == std::optional<std::size_t>(1));
        CHECK(error->message() == "rule at index 1 is null");
        CHECK(ctx.empty());
    }

    SUBCASE("Null rule in a chain batch") {
        auto error = runChain(&ctx, static_cast<Rule<int> *>(nullptr));
        REQUIRE(error.has_value());
        CHECK(error->code() == ErrorCode::NilNode);
        CHECK(error->index() == std::optional<std::size_t>(0));
    }

    SUBCASE("Multiple chain roots fire nothing") {
        auto rule1 = counter(RuleType::Chain, "hits");
        auto rule2 = counter(RuleType::Chain, "hits");
        auto error = runChain(&ctx, rule1.get(), rule2.get());
        REQUIRE(error.has_value());
        CHECK(error->code() == ErrorCode::ChainMultipleRoots);
        CHECK_FALSE(ctx.has("hits"));
    }

    SUBCASE("Unknown strategy") {
        auto rule = counter(RuleType::BestFirst, "hits");
        auto error = run(static_cast<RuleType>(42), {}, &ctx, rule.get());
        REQUIRE(error.has_value());
        CHECK(error->code() == ErrorCode::InvalidRuleType);
        CHECK(ctx.empty());
    }

    SUBCASE("Empty batch is a no-op even for an unknown strategy") {
        CHECK_FALSE(run(static_cast<RuleType>(42), {}, &ctx).has_value());
    }
}

TEST_CASE("Runner accepts a span of roots") {
    RuleContext<int> ctx;
    auto rule1 = counter(RuleType::BestFirst, "first", false);
    auto rule2 = counter(RuleType::BestFirst, "second");

    std::vector<Rule<int> *> roots{rule1.get(), rule2.get()};
    REQUIRE_FALSE(run(RuleType::BestFirst, {}, &ctx, std::span<Rule<int> *const>(roots)).has_value());
    CHECK_FALSE(ctx.has("first"));
    CHECK(ctx.mustGet("second") == 1);
}

TEST_CASE("Mixed strategies follow each level's own tag") {
    RuleContext<int> ctx;

    SUBCASE("Best-first parent with chain children") {
        auto chainA = counter(RuleType::Chain, "a", false);
        chainA->mustAddChild(counter(RuleType::Chain, "a_child"));
        auto chainB = counter(RuleType::Chain, "b");
        chainB->mustAddChild(counter(RuleType::Chain, "b_child"));
        auto chainC = counter(RuleType::Chain, "c");

        auto root = counter(RuleType::BestFirst, "root");
        std::vector<RulePtr<int>> children;
        children.push_back(std::move(chainA));
        children.push_back(std::move(chainB));
        children.push_back(std::move(chainC));
        root->mustAddChildren(std::move(children));

        REQUIRE_FALSE(runBestFirst(&ctx, root.get()).has_value());

        // Chain rules always report keepGoing, so every chain sibling gets its turn.
        CHECK(ctx.mustGet("root") == 1);
        CHECK_FALSE(ctx.has("a"));
        CHECK_FALSE(ctx.has("a_child"));
        CHECK(ctx.mustGet("b") == 1);
        CHECK(ctx.mustGet("b_child") == 1);
        CHECK(ctx.mustGet("c") == 1);
    }

    SUBCASE("Chain parent with a best-first child") {
        auto search = counter(RuleType::BestFirst, "search");
        search->mustAddChild(counter(RuleType::BestFirst, "option_1", false));
        search->mustAddChild(counter(RuleType::BestFirst, "option_2"));
        search->mustAddChild(counter(RuleType::BestFirst, "option_3"));

        auto root = counter(RuleType::Chain, "root");
        root->mustAddChild(std::move(search));

        REQUIRE_FALSE(runChain(&ctx, root.get()).has_value());
        CHECK(ctx.mustGet("root") == 1);
        CHECK(ctx.mustGet("search") == 1);
        CHECK_FALSE(ctx.has("option_1"));
        CHECK(ctx.mustGet("option_2") == 1);
        CHECK_FALSE(ctx.has("option_3"));
    }
}

TEST_CASE("Cancellation") {
    RuleContext<int> ctx;

    SUBCASE("Token stopped before the run fails the first rule with no hooks") {
        int hookCalls = 0;
        auto root = makeChainRule<int>(withEvaluation<int>(hook::boolean([&](const RuleView<int> &) {
                                           ++hookCalls;
                                           return true;
                                       })),
                                       withExecution<int>(hook::effect([&](const RuleView<int> &) { ++hookCalls; })));

        std::stop_source source;
        source.request_stop();

        auto error = runChain(source.get_token(), &ctx, root.get());
        REQUIRE(error.has_value());
        CHECK(error->code() == ErrorCode::Canceled);
        CHECK(hookCalls == 0);

        error = runBestFirst(source.get_token(), &ctx, root.get());
        REQUIRE(error.has_value());
        CHECK(error->code() == ErrorCode::Canceled);
        CHECK(hookCalls == 0);
    }

    SUBCASE("Stop requested by a hook cancels the rules below it") {
        std::stop_source source;
        bool childEvaluated = false;

        auto child = makeChainRule<int>(withEvaluation<int>(hook::boolean([&](const RuleView<int> &) {
            childEvaluated = true;
            return true;
        })));
        auto root = makeChainRule<int>(withExecution<int>(hook::effect([&](const RuleView<int> &view) {
            CHECK_FALSE(view.stopRequested());
            source.request_stop();
            CHECK(view.stopRequested());
        })));
        root->mustAddChild(std::move(child));

        auto error = runChain(source.get_token(), &ctx, root.get());
        REQUIRE(error.has_value());
        CHECK(error->code() == ErrorCode::Canceled);
        CHECK_FALSE(childEvaluated);
    }

    SUBCASE("Stop requested mid search fails the next sibling") {
        std::stop_source source;
        auto rule1 = makeBestFirstRule<int>(withEvaluation<int>(hook::boolean([&](const RuleView<int> &) {
            source.request_stop();
            return false;
        })));
        auto rule2 = counter(RuleType::BestFirst, "rule_2");

        auto error = runBestFirst(source.get_token(), &ctx, rule1.get(), rule2.get());
        REQUIRE(error.has_value());
        CHECK(error->code() == ErrorCode::Canceled);
        CHECK_FALSE(ctx.has("rule_2"));
    }

    SUBCASE("A default token never cancels") {
        auto root = counter(RuleType::Chain, "hits");
        CHECK_FALSE(run(RuleType::Chain, std::stop_token{}, &ctx, root.get()).has_value());
        CHECK(ctx.mustGet("hits") == 1);
    }
}

TEST_CASE("Rule trees are reusable across runs and contexts") {
    auto build = [] {
        auto root = counter(RuleType::BestFirst, "root");
        root->mustAddChild(makeBestFirstRule<int>(
            withEvaluation<int>(hook::boolean([](const RuleView<int> &view) { return view.context().has("vip"); })),
            withExecution<int>(hook::effect([](const RuleView<int> &view) { view.context().set("discount", 20); }))));
        root->mustAddChild(makeBestFirstRule<int>(
            withExecution<int>(hook::effect([](const RuleView<int> &view) { view.context().set("discount", 5); }))));
        return root;
    };

    SUBCASE("Same tree, different contexts") {
        auto tree = build();

        RuleContext<int> regular;
        RuleContext<int> vip{{"vip", 1}};

        REQUIRE_FALSE(runBestFirst(&regular, tree.get()).has_value());
        REQUIRE_FALSE(runBestFirst(&vip, tree.get()).has_value());

        CHECK(regular.mustGet("discount") == 5);
        CHECK(vip.mustGet("discount") == 20);
        CHECK(tree->context() == nullptr);
        CHECK(tree->children().front()->context() == nullptr);
    }

    SUBCASE("Identical seeds produce identical mutations") {
        auto tree = build();

        RuleContext<int> first{{"vip", 1}, {"seed", 7}};
        RuleContext<int> second{{"vip", 1}, {"seed", 7}};
        REQUIRE_FALSE(runBestFirst(&first, tree.get()).has_value());
        REQUIRE_FALSE(runBestFirst(&second, tree.get()).has_value());

        auto firstKeys = first.keys();
        auto secondKeys = second.keys();
        std::sort(firstKeys.begin(), firstKeys.end());
        std::sort(secondKeys.begin(), secondKeys.end());
        REQUIRE(firstKeys == secondKeys);
        for (const auto &key : firstKeys) {
            CAPTURE(key);
            CHECK(first.get(key) == second.get(key));
        }
    }

    SUBCASE("A context accumulates across runs") {
        auto tree = build();
        RuleContext<int> ctx;
        for (int i = 0; i < 3; ++i) {
            REQUIRE_FALSE(runBestFirst(&ctx, tree.get()).has_value());
        }
        CHECK(ctx.mustGet("root") == 3);
    }
}

TEST_CASE("Hook exceptions reach the caller") {
    RuleContext<int> ctx;
    auto root = makeChainRule<int>(
        withExecution<int>(hook::effect([](const RuleView<int> &) { throw std::runtime_error("hook blew up"); })));

    CHECK_THROWS_WITH_AS(runChain(&ctx, root.get()), "hook blew up", std::runtime_error);
    CHECK(root->context() == nullptr);
}

TEST_CASE("A run leaves no binding behind") {
    auto root = counter(RuleType::Chain, "root");
    root->mustAddChild(counter(RuleType::Chain, "child"));

    {
        RuleContext<int> scoped;
        REQUIRE_FALSE(runChain(&scoped, root.get()).has_value());
        CHECK(scoped.mustGet("child") == 1);
    }

    CHECK(root->context() == nullptr);
    CHECK(root->children().front()->context() == nullptr);

    auto result = root->fire();
    REQUIRE(result.error.has_value());
    CHECK(result.error->code() == ErrorCode::NilContext);
}
