#include <catch2/catch.hpp>
#include <kapla/dep_graph.hpp>
#include <kapla/log.hpp>
#include <kapla/orchestrator.hpp>
#include <kapla/selection.hpp>
#include "test_support.hpp"

using namespace kapla;

// Layered workspace: `layers` x `width` packages, each depending on up to
// three packages of the layer below
static std::vector<Manifest> layered_packages(int layers, int width) {
    std::vector<Manifest> pkgs;
    for (int l = 0; l < layers; ++l) {
        for (int w = 0; w < width; ++w) {
            std::vector<std::string> deps;
            if (l > 0) {
                for (int k = 0; k < 3; ++k) {
                    deps.push_back("p" + std::to_string(l - 1) + "_" +
                                   std::to_string((w + k) % width));
                }
                std::sort(deps.begin(), deps.end());
                deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
            }
            pkgs.push_back(make_manifest(
                "p" + std::to_string(l) + "_" + std::to_string(w), deps));
        }
    }
    return pkgs;
}

TEST_CASE("dep_graph perf: build and plan 5K packages under 500ms", "[dep_graph][bench]") {
    auto pkgs = layered_packages(50, 100);

    auto start = std::chrono::high_resolution_clock::now();
    auto r = DependencyGraph::build(pkgs);
    REQUIRE(r.is_ok());
    auto plan = r.value().plan();
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(plan.batches.size() == 50);
    REQUIRE(plan.package_count() == 5000);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Build + plan 5K packages: " << ms << " ms");
    REQUIRE(ms < 500);
}

TEST_CASE("selection perf: closure of the top layer under 200ms", "[selection][bench]") {
    auto g = DependencyGraph::build(layered_packages(50, 100)).value();

    auto start = std::chrono::high_resolution_clock::now();
    auto r = select_packages(g, {"p49_0"}, {});
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() > 50);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Closure: " << ms << " ms");
    REQUIRE(ms < 200);
}

TEST_CASE("orchestrator perf: schedule 2K no-op actions under 2s", "[orchestrator][bench]") {
    struct Noop : Action {
        std::string name() const override { return "noop"; }
        ActionOutcome execute(const MergedManifest&, const std::string&,
                              const CancelToken&) override {
            return ActionOutcome::success();
        }
    } action;

    auto g = DependencyGraph::build(layered_packages(20, 100)).value();
    auto names = g.names();
    std::set<std::string> all(names.begin(), names.end());

    Orchestrator::Options opts;
    opts.concurrency = 8;
    Orchestrator orch(opts);

    log::Level saved = log::get_level();
    log::set_level(log::Warn);
    auto start = std::chrono::high_resolution_clock::now();
    auto r = orch.run(g, all, action);
    auto end = std::chrono::high_resolution_clock::now();
    log::set_level(saved);

    REQUIRE(r.is_ok());
    REQUIRE(r.value().count(TaskStatus::Succeeded) == 2000);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("2K no-op actions: " << ms << " ms");
    REQUIRE(ms < 2000);
}
