#pragma once

#include <folly/Executor.h>
#include <folly/Try.h>
#include <folly/futures/Future.h>

#include <cstdint>
#include <type_traits>
#include <utility>
#include <vector>

namespace lockstep {

// Result of the run driven by one seed
template<typename R>
struct seed_result {
    std::uint64_t _seed{0};
    folly::Try<R> _result;

    auto seed() const -> std::uint64_t { return _seed; }
    auto result() const -> const folly::Try<R>& { return _result; }
};

// Run one independent run per seed on the executor and wait for all of them.
// Each invocation of run_one must build its own system instance and model
// state; nothing is shared between runs. Exceptions stay in the seed's Try.
template<typename RunOne>
auto run_seeds(const std::vector<std::uint64_t>& seeds, folly::Executor* executor, RunOne run_one)
    -> std::vector<seed_result<std::invoke_result_t<RunOne&, std::uint64_t>>> {
    using result_type = std::invoke_result_t<RunOne&, std::uint64_t>;

    std::vector<folly::Future<result_type>> futures;
    futures.reserve(seeds.size());
    for (auto seed : seeds) {
        futures.push_back(folly::via(folly::getKeepAliveToken(executor), [run_one, seed]() mutable {
            return run_one(seed);
        }));
    }

    auto tries = folly::collectAll(std::move(futures)).get();

    std::vector<seed_result<result_type>> results;
    results.reserve(seeds.size());
    for (std::size_t i = 0; i < seeds.size(); ++i) {
        results.push_back(seed_result<result_type>{seeds[i], std::move(tries[i])});
    }
    return results;
}

} // namespace lockstep
