#pragma once

#include <lockstep/configuration.hpp>
#include <lockstep/console_logger.hpp>
#include <lockstep/exceptions.hpp>
#include <lockstep/logger.hpp>
#include <lockstep/operation.hpp>

#include <concepts>
#include <cstdint>
#include <string>
#include <utility>

namespace lockstep {

// Domain-specific operation generator.
// Must be deterministic: the same seed and configuration yield the same sequence.
template<typename G, typename D>
concept sequence_generator = domain_types<D> && requires(
    const G& generator,
    std::uint64_t seed,
    const generator_configuration& config
) {
    { generator.generate(seed, config) } -> std::same_as<sequence<D>>;
};

// Uniform front for a domain generator. Rejects invalid configurations before
// drawing and reports any generator-internal error as a generator_exception
// tagged with the seed, so a failing run can be reproduced.
template<domain_types D, typename Generator, diagnostic_logger Logger = console_logger>
requires sequence_generator<Generator, D>
class generator_adapter {
public:
    explicit generator_adapter(Generator generator, Logger logger = Logger{})
        : _generator(std::move(generator))
        , _logger(std::move(logger)) {}

    auto generate(std::uint64_t seed, const generator_configuration& config) const -> sequence<D> {
        if (!config.is_valid()) {
            throw generator_exception(seed, "invalid generator configuration");
        }

        sequence<D> result;
        try {
            result = _generator.generate(seed, config);
        } catch (const lockstep_exception&) {
            throw;
        } catch (const std::exception& e) {
            throw generator_exception(seed, e.what());
        }

        if (result.size() > config.max_sequence_length()) {
            throw generator_exception(seed,
                "sequence of " + std::to_string(result.size()) + " operations exceeds the configured maximum");
        }

        auto seed_text = std::to_string(seed);
        auto size_text = std::to_string(result.size());
        auto level_text = std::to_string(result.env().start_level());
        _logger.debug("Generated operation sequence", {
            {"seed", seed_text},
            {"operations", size_text},
            {"start_level", level_text}
        });
        return result;
    }

private:
    Generator _generator;
    mutable Logger _logger;
};

} // namespace lockstep
