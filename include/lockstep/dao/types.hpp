#pragma once

#include <lockstep/types.hpp>

#include <array>
#include <cstdint>
#include <iomanip>
#include <map>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lockstep::dao {

using address = std::string;

// Error taxonomy shared by the reference model and the contract.
// The numeric tags are what the contract fails with and must stay stable.
enum class error_code : std::uint64_t {
    not_admin = 100,
    not_pending_admin = 101,
    fail_proposal_check = 102,
    proposal_not_exist = 103,
    voting_stage_over = 104,
    forbidden_xtz = 107,
    proposal_not_unique = 108,
    bad_entrypoint_parameter = 110,
    not_enough_frozen_tokens = 113,
    wrong_token_amount = 119,
    not_proposing_stage = 120,
    empty_flush = 122,
    max_proposals_reached = 123,
    drop_proposal_condition_not_met = 125,
    fail_transfer_contract_tokens = 300,
    insufficient_xtz_balance = 301
};

inline constexpr std::array<error_code, 16> all_error_codes{
    error_code::not_admin,
    error_code::not_pending_admin,
    error_code::fail_proposal_check,
    error_code::proposal_not_exist,
    error_code::voting_stage_over,
    error_code::forbidden_xtz,
    error_code::proposal_not_unique,
    error_code::bad_entrypoint_parameter,
    error_code::not_enough_frozen_tokens,
    error_code::wrong_token_amount,
    error_code::not_proposing_stage,
    error_code::empty_flush,
    error_code::max_proposals_reached,
    error_code::drop_proposal_condition_not_met,
    error_code::fail_transfer_contract_tokens,
    error_code::insufficient_xtz_balance
};

inline auto operator<<(std::ostream& os, error_code code) -> std::ostream& {
    switch (code) {
        case error_code::not_admin:                       return os << "NOT_ADMIN";
        case error_code::not_pending_admin:               return os << "NOT_PENDING_ADMIN";
        case error_code::fail_proposal_check:             return os << "FAIL_PROPOSAL_CHECK";
        case error_code::proposal_not_exist:              return os << "PROPOSAL_NOT_EXIST";
        case error_code::voting_stage_over:               return os << "VOTING_STAGE_OVER";
        case error_code::forbidden_xtz:                   return os << "FORBIDDEN_XTZ";
        case error_code::proposal_not_unique:             return os << "PROPOSAL_NOT_UNIQUE";
        case error_code::bad_entrypoint_parameter:        return os << "BAD_ENTRYPOINT_PARAMETER";
        case error_code::not_enough_frozen_tokens:        return os << "NOT_ENOUGH_FROZEN_TOKENS";
        case error_code::wrong_token_amount:              return os << "WRONG_TOKEN_AMOUNT";
        case error_code::not_proposing_stage:             return os << "NOT_PROPOSING_STAGE";
        case error_code::empty_flush:                     return os << "EMPTY_FLUSH";
        case error_code::max_proposals_reached:           return os << "MAX_PROPOSALS_REACHED";
        case error_code::drop_proposal_condition_not_met: return os << "DROP_PROPOSAL_CONDITION_NOT_MET";
        case error_code::fail_transfer_contract_tokens:   return os << "FAIL_TRANSFER_CONTRACT_TOKENS";
        case error_code::insufficient_xtz_balance:        return os << "INSUFFICIENT_XTZ_BALANCE";
    }
    return os << "UNKNOWN_ERROR(" << static_cast<std::uint64_t>(code) << ")";
}

// Proposal metadata kinds

struct text_metadata {
    std::string _text;
    auto operator==(const text_metadata&) const -> bool = default;
};

// Send tez from the DAO to a receiver once accepted
struct xtz_transfer {
    address _receiver;
    mutez _amount{0};
    auto operator==(const xtz_transfer&) const -> bool = default;
};

// Send governance tokens held by the DAO to a receiver once accepted
struct token_transfer {
    address _receiver;
    std::uint64_t _amount{0};
    auto operator==(const token_transfer&) const -> bool = default;
};

// Set or, without a value, remove a registry entry once accepted
struct registry_update {
    std::string _key;
    std::optional<std::string> _value;
    auto operator==(const registry_update&) const -> bool = default;
};

using proposal_metadata = std::variant<text_metadata, xtz_transfer, token_transfer, registry_update>;

// Builtin entrypoint payloads

struct propose {
    std::uint64_t _frozen_token{0};
    proposal_metadata _metadata;
    auto operator==(const propose&) const -> bool = default;
};

struct vote {
    std::string _proposal_key;
    bool _upvote{true};
    std::uint64_t _vote_amount{0};
    auto operator==(const vote&) const -> bool = default;
};

struct freeze {
    std::uint64_t _amount{0};
    auto operator==(const freeze&) const -> bool = default;
};

struct unfreeze {
    std::uint64_t _amount{0};
    auto operator==(const unfreeze&) const -> bool = default;
};

// Process up to _count proposals whose voting stage is over
struct flush {
    std::uint64_t _count{0};
    auto operator==(const flush&) const -> bool = default;
};

struct drop_proposal {
    std::string _proposal_key;
    auto operator==(const drop_proposal&) const -> bool = default;
};

struct transfer_ownership {
    address _new_owner;
    auto operator==(const transfer_ownership&) const -> bool = default;
};

struct accept_ownership {
    auto operator==(const accept_ownership&) const -> bool = default;
};

// Admin-only: move tokens the DAO holds on a token contract
struct transfer_contract_tokens {
    address _contract;
    address _receiver;
    std::uint64_t _amount{0};
    auto operator==(const transfer_contract_tokens&) const -> bool = default;
};

// The default entrypoint
struct receive_xtz {
    auto operator==(const receive_xtz&) const -> bool = default;
};

using parameter = std::variant<
    propose,
    vote,
    freeze,
    unfreeze,
    flush,
    drop_proposal,
    transfer_ownership,
    accept_ownership,
    transfer_contract_tokens,
    receive_xtz>;

// Entrypoints that reject any tez sent along
inline auto forbids_xtz(const parameter& param) -> bool {
    return std::holds_alternative<vote>(param) ||
           std::holds_alternative<flush>(param) ||
           std::holds_alternative<freeze>(param) ||
           std::holds_alternative<unfreeze>(param) ||
           std::holds_alternative<drop_proposal>(param);
}

// Custom entrypoints of the registry variant

// Send (key, value?) to the view contract
struct lookup_registry {
    std::string _key;
    address _view;
    auto operator==(const lookup_registry&) const -> bool = default;
};

// Entrypoint of the registry variant without a system-side dispatch
struct update_receivers {
    std::vector<address> _receivers;
    auto operator==(const update_receivers&) const -> bool = default;
};

using registry_parameter = std::variant<lookup_registry, update_receivers>;

// Storage

struct dao_config {
    // Levels per stage; odd stages accept proposals, a proposal is voted on
    // in the stage after the one it was made in
    level_t _period{10};
    // Votes needed for a proposal to be accepted
    std::uint64_t _quorum{10};
    // Tokens a proposer must lock
    std::uint64_t _proposal_lock{10};
    // Rejected proposals lose _proposal_lock / _slash_divisor
    std::uint64_t _slash_divisor{2};
    std::uint64_t _max_proposals{5};
    mutez _min_xtz_amount{1};
    mutez _max_xtz_amount{100};
    auto operator==(const dao_config&) const -> bool = default;
};

struct freeze_record {
    std::uint64_t _current_stage{0};
    // Locked in proposals and votes
    std::uint64_t _staked{0};
    // Frozen during _current_stage; usable from the next stage on
    std::uint64_t _current_unstaked{0};
    std::uint64_t _past_unstaked{0};
    auto operator==(const freeze_record&) const -> bool = default;
};

struct proposal {
    address _proposer;
    std::uint64_t _frozen_token{0};
    proposal_metadata _metadata;
    level_t _start_level{0};
    std::uint64_t _voting_stage{0};
    std::uint64_t _upvotes{0};
    std::uint64_t _downvotes{0};
    std::map<address, std::uint64_t> _voter_stakes;
    auto operator==(const proposal&) const -> bool = default;
};

struct storage {
    address _admin;
    address _pending_owner;
    address _guardian;
    address _governance_token;
    std::uint64_t _token_id{0};
    level_t _start_level{0};
    dao_config _config;
    std::uint64_t _frozen_total_supply{0};
    std::map<address, freeze_record> _freeze_history;
    std::map<std::string, proposal> _proposals;
    // Keys of proposals not flushed or dropped yet, oldest first
    std::vector<std::string> _ongoing;
    std::map<std::string, std::string> _registry;
    auto operator==(const storage&) const -> bool = default;
};

// Auxiliary storages

struct transfer_destination {
    address _to;
    std::uint64_t _token_id{0};
    std::uint64_t _amount{0};
    auto operator==(const transfer_destination&) const -> bool = default;
};

struct transfer_batch {
    address _from;
    std::vector<transfer_destination> _txs;
    auto operator==(const transfer_batch&) const -> bool = default;
};

// Storage of the governance token contract: every batch it was handed
struct token_ledger {
    std::vector<transfer_batch> _transfers;
    auto operator==(const token_ledger&) const -> bool = default;
};

// Storage of the view consumer: every (key, value?) it received
struct lookup_log {
    std::vector<std::pair<std::string, std::optional<std::string>>> _entries;
    auto operator==(const lookup_log&) const -> bool = default;
};

using auxiliary_storage = std::variant<token_ledger, lookup_log>;

// Stage of a level; stages are numbered from the DAO's start level
inline auto stage_of(level_t level, level_t start_level, level_t period) -> std::uint64_t {
    if (period == 0 || level < start_level) {
        return 0;
    }
    return (level - start_level) / period;
}

// Rendering

// Micheline-style rendering of an optional registry value
inline auto render_option(const std::optional<std::string>& value) -> std::string {
    if (value) {
        return "Some \"" + *value + "\"";
    }
    return "None";
}

inline auto operator<<(std::ostream& os, const proposal_metadata& metadata) -> std::ostream& {
    std::visit([&os](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, text_metadata>) {
            os << "text \"" << value._text << "\"";
        } else if constexpr (std::is_same_v<T, xtz_transfer>) {
            os << "xtz_transfer " << value._amount << " mutez to " << value._receiver;
        } else if constexpr (std::is_same_v<T, token_transfer>) {
            os << "token_transfer " << value._amount << " to " << value._receiver;
        } else {
            os << "registry_update \"" << value._key << "\" := " << render_option(value._value);
        }
    }, metadata);
    return os;
}

inline auto operator<<(std::ostream& os, const parameter& param) -> std::ostream& {
    std::visit([&os](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, propose>) {
            os << "propose { frozen_token = " << value._frozen_token << ", metadata = " << value._metadata << " }";
        } else if constexpr (std::is_same_v<T, vote>) {
            os << "vote { proposal = " << value._proposal_key
               << ", type = " << (value._upvote ? "up" : "down")
               << ", amount = " << value._vote_amount << " }";
        } else if constexpr (std::is_same_v<T, freeze>) {
            os << "freeze " << value._amount;
        } else if constexpr (std::is_same_v<T, unfreeze>) {
            os << "unfreeze " << value._amount;
        } else if constexpr (std::is_same_v<T, flush>) {
            os << "flush " << value._count;
        } else if constexpr (std::is_same_v<T, drop_proposal>) {
            os << "drop_proposal " << value._proposal_key;
        } else if constexpr (std::is_same_v<T, transfer_ownership>) {
            os << "transfer_ownership " << value._new_owner;
        } else if constexpr (std::is_same_v<T, accept_ownership>) {
            os << "accept_ownership";
        } else if constexpr (std::is_same_v<T, transfer_contract_tokens>) {
            os << "transfer_contract_tokens { contract = " << value._contract
               << ", receiver = " << value._receiver << ", amount = " << value._amount << " }";
        } else {
            os << "receive_xtz";
        }
    }, param);
    return os;
}

inline auto operator<<(std::ostream& os, const registry_parameter& param) -> std::ostream& {
    std::visit([&os](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, lookup_registry>) {
            os << "lookup_registry { key = \"" << value._key << "\", view = " << value._view << " }";
        } else {
            os << "update_receivers [";
            for (std::size_t i = 0; i < value._receivers.size(); ++i) {
                os << (i == 0 ? "" : ", ") << value._receivers[i];
            }
            os << "]";
        }
    }, param);
    return os;
}

inline auto operator<<(std::ostream& os, const storage& st) -> std::ostream& {
    os << "admin: " << st._admin << "\n";
    os << "pending_owner: " << st._pending_owner << "\n";
    os << "guardian: " << st._guardian << "\n";
    os << "governance_token: " << st._governance_token << " #" << st._token_id << "\n";
    os << "start_level: " << st._start_level << "\n";
    os << "config: period=" << st._config._period
       << " quorum=" << st._config._quorum
       << " proposal_lock=" << st._config._proposal_lock
       << " slash_divisor=" << st._config._slash_divisor
       << " max_proposals=" << st._config._max_proposals
       << " xtz_bounds=[" << st._config._min_xtz_amount << ", " << st._config._max_xtz_amount << "]\n";
    os << "frozen_total_supply: " << st._frozen_total_supply << "\n";
    os << "freeze_history:\n";
    for (const auto& [owner, record] : st._freeze_history) {
        os << "  " << owner << ": stage=" << record._current_stage
           << " staked=" << record._staked
           << " current_unstaked=" << record._current_unstaked
           << " past_unstaked=" << record._past_unstaked << "\n";
    }
    os << "proposals:\n";
    for (const auto& [key, p] : st._proposals) {
        os << "  " << key << ": proposer=" << p._proposer
           << " frozen=" << p._frozen_token
           << " start_level=" << p._start_level
           << " voting_stage=" << p._voting_stage
           << " up=" << p._upvotes
           << " down=" << p._downvotes
           << " metadata=" << p._metadata;
        for (const auto& [voter, stake] : p._voter_stakes) {
            os << " " << voter << "=" << stake;
        }
        os << "\n";
    }
    os << "ongoing: [";
    for (std::size_t i = 0; i < st._ongoing.size(); ++i) {
        os << (i == 0 ? "" : ", ") << st._ongoing[i];
    }
    os << "]\n";
    os << "registry:";
    for (const auto& [key, value] : st._registry) {
        os << " " << key << "=" << value;
    }
    return os;
}

inline auto operator<<(std::ostream& os, const auxiliary_storage& aux) -> std::ostream& {
    if (const auto* ledger = std::get_if<token_ledger>(&aux)) {
        os << "[";
        for (std::size_t i = 0; i < ledger->_transfers.size(); ++i) {
            const auto& batch = ledger->_transfers[i];
            os << (i == 0 ? "" : ", ") << "{ from = " << batch._from << ", txs = [";
            for (std::size_t j = 0; j < batch._txs.size(); ++j) {
                const auto& tx = batch._txs[j];
                os << (j == 0 ? "" : ", ") << tx._to << " #" << tx._token_id << " " << tx._amount;
            }
            os << "] }";
        }
        return os << "]";
    }

    const auto& log = std::get<lookup_log>(aux);
    os << "[";
    for (std::size_t i = 0; i < log._entries.size(); ++i) {
        os << (i == 0 ? "" : ", ") << "(\"" << log._entries[i].first << "\", " << render_option(log._entries[i].second) << ")";
    }
    return os << "]";
}

// Key of a proposal: FNV-1a over the proposer and the rendered payload
inline auto proposal_key_of(const address& proposer, const propose& payload) -> std::string {
    std::ostringstream material;
    material << proposer << "|" << payload._frozen_token << "|" << payload._metadata;

    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : material.str()) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }

    std::ostringstream key;
    key << std::hex << std::setw(16) << std::setfill('0') << hash;
    return key.str();
}

// Domain bundles consumed by the engine

template<typename Custom>
struct domain {
    using builtin_parameter_type = parameter;
    using custom_parameter_type = Custom;
    using storage_type = storage;
    using auxiliary_storage_type = auxiliary_storage;
    using error_code_type = error_code;
};

using base_domain = domain<no_custom_entrypoint>;
using registry_domain = domain<registry_parameter>;

} // namespace lockstep::dao

namespace lockstep {

template<>
struct error_code_traits<dao::error_code> {
    static auto from_numeric(std::uint64_t tag) -> std::optional<dao::error_code> {
        for (auto code : dao::all_error_codes) {
            if (static_cast<std::uint64_t>(code) == tag) {
                return code;
            }
        }
        return std::nullopt;
    }

    static auto to_numeric(dao::error_code code) -> std::uint64_t {
        return static_cast<std::uint64_t>(code);
    }

    static auto all() -> std::span<const dao::error_code> {
        return dao::all_error_codes;
    }
};

static_assert(domain_types<dao::base_domain>, "base DAO domain must satisfy domain_types");
static_assert(domain_types<dao::registry_domain>, "registry DAO domain must satisfy domain_types");

} // namespace lockstep
