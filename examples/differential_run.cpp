// Example: Differential Run of the Registry DAO
// This example demonstrates:
// 1. Loading a run configuration from an optional JSON file
// 2. Generating one call sequence per configured seed
// 3. Running every seed concurrently against the contract and its model
// 4. Reporting divergences and faults per seed
//
// Usage: differential_run [config.json]

#include <lockstep/configuration.hpp>
#include <lockstep/console_logger.hpp>
#include <lockstep/dao/fixture.hpp>
#include <lockstep/dao/generator.hpp>
#include <lockstep/dao/types.hpp>
#include <lockstep/exceptions.hpp>
#include <lockstep/generator.hpp>
#include <lockstep/harness.hpp>

#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/init/Init.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace lockstep;

namespace {
    constexpr std::size_t worker_threads = 4;
    constexpr int exit_success = 0;
    constexpr int exit_failure = 1;

    using registry_generator = dao::generator<dao::registry_parameter>;
    using registry_fixture = dao::fixture<dao::registry_parameter>;

    auto load_configuration(int argc, char* argv[]) -> run_configuration {
        if (argc < 2) {
            return run_configuration{};
        }

        std::ifstream file(argv[1]);
        if (!file) {
            throw configuration_exception(std::string("cannot open ") + argv[1]);
        }
        std::ostringstream text;
        text << file.rdbuf();
        return parse_run_configuration(text.str());
    }

    auto run_configured_seeds(const run_configuration& config) -> int {
        folly::CPUThreadPoolExecutor executor(worker_threads);
        generator_adapter<dao::registry_domain, registry_generator> adapter(
            registry_generator{}, console_logger(config.engine().min_log_level(), "generator"));

        auto results = run_seeds(config.seeds(), &executor, [&config, adapter](std::uint64_t seed) {
            auto seq = adapter.generate(seed, config.generator());
            registry_fixture runner(
                config.engine(),
                dao::fixture_options{},
                console_logger(config.engine().min_log_level(), "seed=" + std::to_string(seed)));
            return runner.run(seq);
        });

        int failed_seeds = 0;
        for (const auto& entry : results) {
            std::cout << "seed " << entry.seed() << ": ";

            if (entry.result().hasException()) {
                std::cout << "error\n  " << entry.result().exception().what() << "\n";
                ++failed_seeds;
                continue;
            }

            const auto& result = entry.result().value();
            std::cout << result.status()
                      << " (model " << result.model_applied()
                      << ", system " << result.system_applied() << " applied)\n";

            if (result.divergence()) {
                std::cout << result.divergence()->render() << "\n";
                ++failed_seeds;
            } else if (result.fatal()) {
                std::cout << "  fault at step " << result.fatal()->step()
                          << " (" << result.fatal()->operation() << "): "
                          << result.fatal()->message() << "\n";
                ++failed_seeds;
            }
        }
        return failed_seeds;
    }
}

auto main(int argc, char* argv[]) -> int {
    folly::Init init(&argc, &argv);

    std::cout << std::string(60, '=') << "\n";
    std::cout << "  Registry DAO Differential Run\n";
    std::cout << std::string(60, '=') << "\n\n";

    run_configuration config;
    try {
        config = load_configuration(argc, argv);
    } catch (const configuration_exception& e) {
        std::cerr << e.what() << "\n";
        return exit_failure;
    }

    std::cout << "Running " << config.seeds().size() << " seed(s)\n\n";
    int failed_seeds = run_configured_seeds(config);

    std::cout << "\n" << std::string(60, '=') << "\n";
    if (failed_seeds == 0) {
        std::cout << "All seeds agreed with the model\n";
        return exit_success;
    }
    std::cout << failed_seeds << " seed(s) diverged or failed\n";
    return exit_failure;
}
