#pragma once

#include <lockstep/configuration.hpp>
#include <lockstep/dao/types.hpp>
#include <lockstep/generator.hpp>
#include <lockstep/operation.hpp>
#include <lockstep/types.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace lockstep::dao {

// Fixed handles of one deployment; every run gets its own chain
inline const std::string primary_address = "KT1DaoPrimaryContract";
inline const std::string guardian_address = "KT1DaoGuardian";
inline const std::string governance_token_address = "KT1DaoGovernanceToken";
inline const std::string view_consumer_address = "KT1DaoViewConsumer";

inline auto sender_address(std::size_t index) -> std::string {
    return "tz1DaoSender" + std::to_string(index);
}

// Seeded generator of DAO call sequences.
//
// Draws proposals with the configured weight and spreads the rest over the
// other entrypoints. A share of the draws is deliberately invalid (wrong
// token amounts, unknown keys, tez on entrypoints that forbid it) so error
// paths are compared as well. For the registry variant it also emits custom
// entrypoint calls.
template<typename Custom>
class generator {
public:
    using domain_type = domain<Custom>;
    using operation_type = operation_t<domain_type>;

    static constexpr bool registry_enabled = !std::is_same_v<Custom, no_custom_entrypoint>;

    // Frozen tokens every sender starts with, usable from the first stage
    static constexpr std::uint64_t initial_frozen_tokens = 50;

    explicit generator(dao_config config = dao_config{})
        : _config(std::move(config)) {}

    auto generate(std::uint64_t seed, const generator_configuration& cfg) const -> sequence<domain_type> {
        std::mt19937_64 rng(seed);
        draw_state state;

        sequence<domain_type> result;
        result._environment = environment{
            cfg.start_level(),
            entity_handle(primary_address),
            entity_handle(guardian_address),
            entity_handle(governance_token_address),
            entity_handle(view_consumer_address)
        };
        result._initial_balance = cfg.initial_balance();
        for (std::size_t i = 0; i < cfg.sender_count(); ++i) {
            result._senders.emplace_back(sender_address(i));
        }
        result._initial_storage = initial_storage(result._senders, cfg.start_level());

        auto min_length = std::max<std::size_t>(1, cfg.max_sequence_length() / 2);
        auto length = uniform(rng, min_length, cfg.max_sequence_length());
        result._operations.reserve(length);
        for (std::size_t i = 0; i < length; ++i) {
            result._operations.push_back(draw(rng, cfg, result._senders, state));
        }
        return result;
    }

    auto config() const -> const dao_config& { return _config; }

private:
    struct draw_state {
        std::vector<std::string> _keys;
    };

    static inline const std::array<std::string, 3> registry_keys{"quorum", "fee", "treasury"};

    auto initial_storage(const std::vector<entity_handle>& senders, level_t start_level) const -> storage {
        storage st;
        st._admin = senders.front().value();
        st._guardian = guardian_address;
        st._governance_token = governance_token_address;
        st._token_id = 0;
        st._start_level = start_level;
        st._config = _config;
        for (const auto& sender : senders) {
            st._freeze_history[sender.value()] = freeze_record{0, 0, 0, initial_frozen_tokens};
            st._frozen_total_supply += initial_frozen_tokens;
        }
        return st;
    }

    auto draw(
        std::mt19937_64& rng,
        const generator_configuration& cfg,
        const std::vector<entity_handle>& senders,
        draw_state& state
    ) const -> operation_type {
        operation_type op;
        op._sender = senders[uniform(rng, 0, senders.size() - 1)];
        if (chance(rng, 0.3)) {
            op._advance = uniform<level_t>(rng, 1, cfg.max_advance());
        }
        // Mostly free calls; some carry tez
        if (chance(rng, 0.1)) {
            op._amount = uniform<mutez>(rng, 1, 5);
        }

        if constexpr (registry_enabled) {
            if (chance(rng, 0.15)) {
                op._parameter = draw_custom(rng, senders);
                return op;
            }
        }

        if (chance(rng, cfg.proposal_weight())) {
            auto payload = draw_propose(rng, senders);
            state._keys.push_back(proposal_key_of(op._sender.value(), payload));
            op._parameter = parameter{std::move(payload)};
            return op;
        }
        op._parameter = draw_other(rng, senders, state);
        return op;
    }

    auto draw_propose(std::mt19937_64& rng, const std::vector<entity_handle>& senders) const -> propose {
        propose p;
        p._frozen_token = chance(rng, 0.9) ? _config._proposal_lock : _config._proposal_lock + 1;

        const auto& receiver = senders[uniform(rng, 0, senders.size() - 1)].value();
        switch (uniform(rng, 0, 3)) {
            case 0:
                p._metadata = text_metadata{chance(rng, 0.9) ? "proposal-" + std::to_string(uniform(rng, 0, 99)) : ""};
                break;
            case 1:
                // Receivers are implicit accounts or the guardian, never a tracked entity
                p._metadata = xtz_transfer{
                    chance(rng, 0.2) ? guardian_address : receiver,
                    uniform<mutez>(rng, 0, _config._max_xtz_amount + 20)};
                break;
            case 2:
                p._metadata = token_transfer{receiver, uniform<std::uint64_t>(rng, 0, 20)};
                break;
            default: {
                std::optional<std::string> value;
                if (chance(rng, 0.7)) {
                    value = "value-" + std::to_string(uniform(rng, 0, 9));
                }
                auto key = chance(rng, 0.9) ? registry_keys[uniform(rng, 0, registry_keys.size() - 1)] : "";
                p._metadata = registry_update{std::move(key), std::move(value)};
                break;
            }
        }
        return p;
    }

    auto draw_other(std::mt19937_64& rng, const std::vector<entity_handle>& senders, const draw_state& state) const
        -> parameter {
        auto pick_key = [&]() -> std::string {
            if (state._keys.empty() || chance(rng, 0.1)) {
                return "0000000000000000";
            }
            return state._keys[uniform(rng, 0, state._keys.size() - 1)];
        };
        const auto& someone = senders[uniform(rng, 0, senders.size() - 1)].value();

        switch (uniform(rng, 0, 9)) {
            case 0:
            case 1:
                return vote{pick_key(), chance(rng, 0.7), uniform<std::uint64_t>(rng, 0, 8)};
            case 2:
                return freeze{uniform<std::uint64_t>(rng, 0, 15)};
            case 3:
                return unfreeze{uniform<std::uint64_t>(rng, 0, 15)};
            case 4:
                return flush{uniform<std::uint64_t>(rng, 0, 3)};
            case 5:
                return drop_proposal{pick_key()};
            case 6:
                return transfer_ownership{someone};
            case 7:
                return accept_ownership{};
            case 8:
                return transfer_contract_tokens{
                    chance(rng, 0.8) ? governance_token_address : guardian_address,
                    someone,
                    uniform<std::uint64_t>(rng, 1, 10)};
            default:
                return receive_xtz{};
        }
    }

    auto draw_custom(std::mt19937_64& rng, const std::vector<entity_handle>& senders) const -> Custom {
        if (chance(rng, 0.8)) {
            return lookup_registry{registry_keys[uniform(rng, 0, registry_keys.size() - 1)], view_consumer_address};
        }
        update_receivers update;
        for (const auto& sender : senders) {
            if (chance(rng, 0.5)) {
                update._receivers.push_back(sender.value());
            }
        }
        return update;
    }

    template<typename T = std::size_t>
    static auto uniform(std::mt19937_64& rng, std::type_identity_t<T> low, std::type_identity_t<T> high) -> T {
        return std::uniform_int_distribution<T>(low, high)(rng);
    }

    static auto chance(std::mt19937_64& rng, double probability) -> bool {
        return std::bernoulli_distribution(probability)(rng);
    }

    dao_config _config;
};

static_assert(sequence_generator<generator<no_custom_entrypoint>, base_domain>);
static_assert(sequence_generator<generator<registry_parameter>, registry_domain>);

} // namespace lockstep::dao
