#include <algorithm>
#include <arbiter/arbiter.hpp>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace arbiter::rule;

namespace {

    template <typename F> void measure(const std::string &name, std::size_t iterations, F &&body) {
        auto t0 = std::chrono::steady_clock::now();
        for (std::size_t i = 0; i < iterations; ++i) {
            body(i);
        }
        auto t1 = std::chrono::steady_clock::now();

        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
        std::cout << std::left << std::setw(36) << name << std::right << std::setw(12) << iterations << " ops "
                  << std::setw(10) << ns / static_cast<long long>(iterations) << " ns/op\n";
    }

    // Splits `iterations` across hardware threads, all hammering one context.
    template <typename F> void measureConcurrent(const std::string &name, std::size_t iterations, F &&body) {
        const std::size_t threads = std::max(2u, std::thread::hardware_concurrency());
        const std::size_t perThread = std::max<std::size_t>(1, iterations / threads);

        auto t0 = std::chrono::steady_clock::now();
        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (std::size_t t = 0; t < threads; ++t) {
            workers.emplace_back([&body, perThread] {
                for (std::size_t i = 0; i < perThread; ++i) {
                    body(i);
                }
            });
        }
        for (auto &worker : workers) {
            worker.join();
        }
        auto t1 = std::chrono::steady_clock::now();

        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
        std::cout << std::left << std::setw(36) << name << std::right << std::setw(12) << perThread * threads
                  << " ops " << std::setw(10) << ns / static_cast<long long>(perThread * threads) << " ns/op ("
                  << threads << " threads)\n";
    }

    void check(const std::optional<Error> &error) {
        if (error) {
            std::cerr << "run failed: " << *error << std::endl;
            std::exit(1);
        }
    }

} // namespace

int main(int argc, char **argv) {
    arbiter::core::loadLogLevelFromEnv();
    const std::size_t iterations = std::max<std::size_t>(1, argc > 1 ? std::stoul(argv[1]) : 200000);

    std::cout << "=== RuleContext ===\n";
    {
        RuleContext<int> ctx;
        measure("set", iterations, [&](std::size_t i) { ctx.set("key", static_cast<int>(i)); });
        measure("get", iterations, [&](std::size_t) { (void)ctx.get("key"); });
        measureConcurrent("set (concurrent)", iterations, [&](std::size_t i) { ctx.set("key", static_cast<int>(i)); });
        measureConcurrent("get (concurrent)", iterations, [&](std::size_t) { (void)ctx.get("key"); });
    }
    {
        constexpr std::size_t keys = 1000;
        std::vector<std::string> names;
        names.reserve(keys);
        for (std::size_t k = 0; k < keys; ++k) {
            names.push_back("key" + std::to_string(k));
        }

        measure("fill 1000 keys, no capacity", iterations / keys + 1, [&](std::size_t) {
            RuleContext<int> ctx;
            for (std::size_t k = 0; k < keys; ++k) {
                ctx.set(names[k], static_cast<int>(k));
            }
        });
        measure("fill 1000 keys, capacity 1000", iterations / keys + 1, [&](std::size_t) {
            RuleContext<int> ctx(keys);
            for (std::size_t k = 0; k < keys; ++k) {
                ctx.set(names[k], static_cast<int>(k));
            }
        });
    }

    std::cout << "\n=== Rules ===\n";
    auto stamp = [](const std::string &key, int value) {
        return withExecution<int>(hook::effect([key, value](const RuleView<int> &view) { view.context().set(key, value); }));
    };

    {
        auto rule = makeChainRule<int>(stamp("executed", 1));
        RuleContext<int> ctx;
        measure("chain, single rule", iterations, [&](std::size_t) { check(runChain(&ctx, rule.get())); });
    }
    {
        auto rule = makeBestFirstRule<int>(stamp("executed", 1));
        RuleContext<int> ctx;
        measure("best-first, single rule", iterations, [&](std::size_t) { check(runBestFirst(&ctx, rule.get())); });
    }
    {
        constexpr int depth = 10;
        auto increment = withExecution<int>(hook::effect([](const RuleView<int> &view) {
            auto &ctx = view.context();
            ctx.set("count", ctx.get("count").value_or(0) + 1);
        }));

        RulePtr<int> root;
        for (int level = 0; level < depth; ++level) {
            auto rule = makeChainRule<int>(increment);
            if (root)
                rule->mustAddChild(std::move(root));
            root = std::move(rule);
        }

        RuleContext<int> ctx;
        measure("chain, depth 10", iterations, [&](std::size_t) {
            ctx.set("count", 0);
            check(runChain(&ctx, root.get()));
        });
        if (ctx.mustGet("count") != depth) {
            std::cerr << "chain stopped at depth " << ctx.mustGet("count") << std::endl;
            return 1;
        }
    }
    {
        constexpr int width = 10;
        std::vector<RulePtr<int>> owned;
        std::vector<Rule<int> *> roots;
        for (int idx = 0; idx < width; ++idx) {
            owned.push_back(makeBestFirstRule<int>(
                withEvaluation<int>(hook::boolean([idx](const RuleView<int> &) { return idx == width - 1; })),
                stamp("executed", idx)));
            roots.push_back(owned.back().get());
        }

        RuleContext<int> ctx;
        measure("best-first, width 10, last wins", iterations, [&](std::size_t) {
            check(run<int>(RuleType::BestFirst, {}, &ctx, roots));
        });
    }
    {
        auto rule = makeChainRule<int>(stamp("executed", 1));
        RuleContext<int> ctx;
        std::stop_source source;
        measure("chain, with stop token", iterations, [&](std::size_t) {
            check(runChain(source.get_token(), &ctx, rule.get()));
        });
    }

    std::cout << "\n=== Construction ===\n";
    measure("makeRule with two options", iterations, [&](std::size_t) {
        auto rule = makeRule<int>(RuleType::Chain,
                                  withEvaluation<int>(hook::boolean([](const RuleView<int> &) { return true; })),
                                  stamp("result", 42));
        (void)rule;
    });

    return 0;
}
