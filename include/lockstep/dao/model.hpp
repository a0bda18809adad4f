#pragma once

#include <lockstep/dao/types.hpp>
#include <lockstep/model_executor.hpp>
#include <lockstep/operation.hpp>

#include <algorithm>
#include <optional>
#include <type_traits>
#include <variant>

namespace lockstep::dao {

// Reference semantics of the DAO, over plain structs.
//
// Stages are (level - start_level) / period. Odd stages accept proposals; a
// proposal is voted on during the stage after its own and can be flushed once
// that stage is over. Frozen tokens become usable the stage after they were
// frozen. Flushing an accepted proposal executes its metadata; a rejected one
// costs its proposer frozen_token / slash_divisor tokens.
template<typename Custom>
class model {
public:
    using domain_type = domain<Custom>;
    using state_type = model_state_t<domain_type>;
    using operation_type = operation_t<domain_type>;
    using transition_type = model_transition<domain_type>;

    static constexpr bool registry_enabled = !std::is_same_v<Custom, no_custom_entrypoint>;

    auto apply(const state_type& state, const operation_type& op) const -> transition_type {
        auto next = state;
        std::optional<error_code> error;

        if (op.is_custom()) {
            error = apply_custom(next, op);
        } else {
            error = apply_builtin(next, op);
        }

        if (error) {
            return transition_type::fail(std::move(next), *error);
        }
        return transition_type::ok(std::move(next));
    }

private:
    using result = std::optional<error_code>;

    auto apply_builtin(state_type& s, const operation_type& op) const -> result {
        const auto& param = op.builtin();
        if (forbids_xtz(param) && op.amount() > 0) {
            return error_code::forbidden_xtz;
        }
        s._balance += op.amount();

        const auto& sender = op.sender().value();
        return std::visit([&](const auto& value) -> result {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, propose>) {
                return on_propose(s, sender, value);
            } else if constexpr (std::is_same_v<T, vote>) {
                return on_vote(s, sender, value);
            } else if constexpr (std::is_same_v<T, freeze>) {
                return on_freeze(s, sender, value);
            } else if constexpr (std::is_same_v<T, unfreeze>) {
                return on_unfreeze(s, sender, value);
            } else if constexpr (std::is_same_v<T, flush>) {
                return on_flush(s, value);
            } else if constexpr (std::is_same_v<T, drop_proposal>) {
                return on_drop(s, sender, value);
            } else if constexpr (std::is_same_v<T, transfer_ownership>) {
                if (sender != s._storage._admin) {
                    return error_code::not_admin;
                }
                s._storage._pending_owner = value._new_owner;
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, accept_ownership>) {
                if (sender != s._storage._pending_owner) {
                    return error_code::not_pending_admin;
                }
                s._storage._admin = sender;
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, transfer_contract_tokens>) {
                if (sender != s._storage._admin) {
                    return error_code::not_admin;
                }
                if (value._contract != s._storage._governance_token) {
                    return error_code::fail_transfer_contract_tokens;
                }
                record_token_transfer(s, s._self.value(), value._receiver, value._amount);
                return std::nullopt;
            } else {
                return std::nullopt;
            }
        }, param);
    }

    auto apply_custom(state_type& s, const operation_type& op) const -> result {
        if constexpr (registry_enabled) {
            if (const auto* lookup = std::get_if<lookup_registry>(&op.custom())) {
                s._balance += op.amount();
                std::optional<std::string> found;
                if (auto it = s._storage._registry.find(lookup->_key); it != s._storage._registry.end()) {
                    found = it->second;
                }
                if (auto* view = s.find_entity(entity_handle(lookup->_view))) {
                    if (auto* log = std::get_if<lookup_log>(&view->_storage)) {
                        log->_entries.emplace_back(lookup->_key, std::move(found));
                    }
                }
            }
        }
        // Other custom entrypoints leave the state untouched
        return std::nullopt;
    }

    auto on_propose(state_type& s, const address& sender, const propose& p) const -> result {
        auto& st = s._storage;
        auto stage = current_stage(s);
        if (stage % 2 == 0) {
            return error_code::not_proposing_stage;
        }
        if (!metadata_valid(st, p._metadata)) {
            return error_code::fail_proposal_check;
        }
        if (p._frozen_token != st._config._proposal_lock) {
            return error_code::wrong_token_amount;
        }
        if (st._ongoing.size() >= st._config._max_proposals) {
            return error_code::max_proposals_reached;
        }
        auto key = proposal_key_of(sender, p);
        if (st._proposals.contains(key)) {
            return error_code::proposal_not_unique;
        }
        auto& record = touch(s, sender);
        if (record._past_unstaked < p._frozen_token) {
            return error_code::not_enough_frozen_tokens;
        }

        record._past_unstaked -= p._frozen_token;
        record._staked += p._frozen_token;

        proposal entry;
        entry._proposer = sender;
        entry._frozen_token = p._frozen_token;
        entry._metadata = p._metadata;
        entry._start_level = s._level;
        entry._voting_stage = stage + 1;
        st._proposals.emplace(key, std::move(entry));
        st._ongoing.push_back(key);
        return std::nullopt;
    }

    auto on_vote(state_type& s, const address& sender, const vote& v) const -> result {
        auto& st = s._storage;
        auto it = st._proposals.find(v._proposal_key);
        if (it == st._proposals.end()) {
            return error_code::proposal_not_exist;
        }
        if (current_stage(s) != it->second._voting_stage) {
            return error_code::voting_stage_over;
        }
        if (v._vote_amount == 0) {
            return error_code::bad_entrypoint_parameter;
        }
        auto& record = touch(s, sender);
        if (record._past_unstaked < v._vote_amount) {
            return error_code::not_enough_frozen_tokens;
        }

        record._past_unstaked -= v._vote_amount;
        record._staked += v._vote_amount;
        auto& p = it->second;
        if (v._upvote) {
            p._upvotes += v._vote_amount;
        } else {
            p._downvotes += v._vote_amount;
        }
        p._voter_stakes[sender] += v._vote_amount;
        return std::nullopt;
    }

    auto on_freeze(state_type& s, const address& sender, const freeze& f) const -> result {
        if (f._amount == 0) {
            return error_code::bad_entrypoint_parameter;
        }
        auto& record = touch(s, sender);
        record._current_unstaked += f._amount;
        s._storage._frozen_total_supply += f._amount;
        record_token_transfer(s, sender, s._self.value(), f._amount);
        return std::nullopt;
    }

    auto on_unfreeze(state_type& s, const address& sender, const unfreeze& u) const -> result {
        if (u._amount == 0) {
            return error_code::bad_entrypoint_parameter;
        }
        auto& record = touch(s, sender);
        if (record._past_unstaked < u._amount) {
            return error_code::not_enough_frozen_tokens;
        }
        record._past_unstaked -= u._amount;
        s._storage._frozen_total_supply -= u._amount;
        record_token_transfer(s, s._self.value(), sender, u._amount);
        return std::nullopt;
    }

    auto on_flush(state_type& s, const flush& f) const -> result {
        if (f._count == 0) {
            return error_code::bad_entrypoint_parameter;
        }
        auto& st = s._storage;
        auto stage = current_stage(s);

        std::uint64_t processed = 0;
        while (processed < f._count && !st._ongoing.empty()) {
            auto key = st._ongoing.front();
            auto p = st._proposals.at(key);
            if (stage <= p._voting_stage) {
                break;
            }

            bool accepted = p._upvotes + p._downvotes >= st._config._quorum && p._upvotes > p._downvotes;
            if (accepted) {
                if (auto error = execute_metadata(s, p._metadata)) {
                    return error;
                }
            }

            auto& record = touch(s, p._proposer);
            record._staked -= p._frozen_token;
            if (accepted) {
                record._past_unstaked += p._frozen_token;
            } else {
                auto slash = st._config._slash_divisor == 0 ? 0 : p._frozen_token / st._config._slash_divisor;
                record._past_unstaked += p._frozen_token - slash;
                st._frozen_total_supply -= slash;
            }
            release_votes(s, p);

            st._proposals.erase(key);
            st._ongoing.erase(st._ongoing.begin());
            ++processed;
        }

        if (processed == 0) {
            return error_code::empty_flush;
        }
        return std::nullopt;
    }

    auto on_drop(state_type& s, const address& sender, const drop_proposal& d) const -> result {
        auto& st = s._storage;
        auto it = st._proposals.find(d._proposal_key);
        if (it == st._proposals.end()) {
            return error_code::proposal_not_exist;
        }
        auto p = it->second;
        bool expired = current_stage(s) > p._voting_stage + 1;
        if (sender != p._proposer && sender != st._guardian && !expired) {
            return error_code::drop_proposal_condition_not_met;
        }

        auto& record = touch(s, p._proposer);
        record._staked -= p._frozen_token;
        record._past_unstaked += p._frozen_token;
        release_votes(s, p);

        st._proposals.erase(it);
        st._ongoing.erase(std::find(st._ongoing.begin(), st._ongoing.end(), d._proposal_key));
        return std::nullopt;
    }

    auto execute_metadata(state_type& s, const proposal_metadata& metadata) const -> result {
        if (const auto* xtz = std::get_if<xtz_transfer>(&metadata)) {
            if (s._balance < xtz->_amount) {
                return error_code::insufficient_xtz_balance;
            }
            s._balance -= xtz->_amount;
            if (auto* receiver = s.find_entity(entity_handle(xtz->_receiver))) {
                receiver->_balance += xtz->_amount;
            }
        } else if (const auto* tokens = std::get_if<token_transfer>(&metadata)) {
            record_token_transfer(s, s._self.value(), tokens->_receiver, tokens->_amount);
        } else if (const auto* update = std::get_if<registry_update>(&metadata)) {
            if (update->_value) {
                s._storage._registry[update->_key] = *update->_value;
            } else {
                s._storage._registry.erase(update->_key);
            }
        }
        return std::nullopt;
    }

    auto metadata_valid(const storage& st, const proposal_metadata& metadata) const -> bool {
        return std::visit([&st](const auto& value) -> bool {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, text_metadata>) {
                return !value._text.empty();
            } else if constexpr (std::is_same_v<T, xtz_transfer>) {
                return value._amount >= st._config._min_xtz_amount && value._amount <= st._config._max_xtz_amount;
            } else if constexpr (std::is_same_v<T, token_transfer>) {
                return value._amount > 0;
            } else {
                return registry_enabled && !value._key.empty();
            }
        }, metadata);
    }

    static auto release_votes(state_type& s, const proposal& p) -> void {
        for (const auto& [voter, stake] : p._voter_stakes) {
            auto& record = touch(s, voter);
            record._staked -= stake;
            record._past_unstaked += stake;
        }
    }

    // FA2 transfer through the governance token, seen from its ledger
    static auto record_token_transfer(state_type& s, const address& from, const address& to, std::uint64_t amount)
        -> void {
        auto* token = s.find_entity(entity_handle(s._storage._governance_token));
        if (token == nullptr) {
            return;
        }
        if (auto* ledger = std::get_if<token_ledger>(&token->_storage)) {
            transfer_batch batch;
            batch._from = from;
            batch._txs.push_back(transfer_destination{to, s._storage._token_id, amount});
            ledger->_transfers.push_back(std::move(batch));
        }
    }

    static auto current_stage(const state_type& s) -> std::uint64_t {
        return stage_of(s._level, s._storage._start_level, s._storage._config._period);
    }

    // Freeze record of an owner, rolled over to the current stage
    static auto touch(state_type& s, const address& owner) -> freeze_record& {
        auto stage = current_stage(s);
        auto& record = s._storage._freeze_history[owner];
        if (stage > record._current_stage) {
            record._past_unstaked += record._current_unstaked;
            record._current_unstaked = 0;
            record._current_stage = stage;
        }
        return record;
    }
};

static_assert(reference_model<model<no_custom_entrypoint>, base_domain>);
static_assert(reference_model<model<registry_parameter>, registry_domain>);

} // namespace lockstep::dao
