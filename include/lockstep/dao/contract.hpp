#pragma once

#include <lockstep/dao/codec.hpp>
#include <lockstep/dao/types.hpp>
#include <lockstep/exceptions.hpp>

#include <chain_emulator/contracts.hpp>
#include <chain_emulator/exceptions.hpp>
#include <chain_emulator/types.hpp>

#include <boost/json.hpp>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace lockstep::dao {

// The DAO as an emulator contract: the implementation under test.
//
// Keeps its own layout (hash maps and a proposal queue) and only produces the
// shared storage shape when asked for its storage. Failures are FAILWITH
// values: a bare error tag, or a (tag, detail) pair for the token and tez
// balance errors. Entrypoint handlers are virtual so tests can derive faulty
// variants.
class dao_contract : public chain_emulator::contract {
public:
    using context = chain_emulator::call_context;
    using operations = chain_emulator::operation_list;

    dao_contract(const dao::storage& initial, bool registry_enabled)
        : _registry_enabled(registry_enabled) {
        load(initial);
    }

    auto execute(
        const context& ctx,
        std::string_view entrypoint,
        const boost::json::value& argument
    ) -> operations override {
        if (entrypoint == "lookup_registry" || entrypoint == "update_receivers") {
            if (!_registry_enabled) {
                throw chain_emulator::unknown_entrypoint_exception(ctx.self(), std::string(entrypoint));
            }
            return dispatch_custom(ctx, entrypoint, argument);
        }

        parameter param;
        try {
            param = codec::decode_parameter(entrypoint, argument);
        } catch (const serialization_exception& e) {
            throw chain_emulator::bad_parameter_exception(ctx.self(), e.what());
        }

        if (forbids_xtz(param) && ctx.amount() != 0) {
            fail(ctx, error_code::forbidden_xtz);
        }

        return std::visit([this, &ctx](const auto& value) -> operations {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, propose>) {
                return on_propose(ctx, value);
            } else if constexpr (std::is_same_v<T, vote>) {
                return on_vote(ctx, value);
            } else if constexpr (std::is_same_v<T, freeze>) {
                return on_freeze(ctx, value);
            } else if constexpr (std::is_same_v<T, unfreeze>) {
                return on_unfreeze(ctx, value);
            } else if constexpr (std::is_same_v<T, flush>) {
                return on_flush(ctx, value);
            } else if constexpr (std::is_same_v<T, drop_proposal>) {
                return on_drop_proposal(ctx, value);
            } else if constexpr (std::is_same_v<T, transfer_ownership>) {
                return on_transfer_ownership(ctx, value);
            } else if constexpr (std::is_same_v<T, accept_ownership>) {
                return on_accept_ownership(ctx, value);
            } else if constexpr (std::is_same_v<T, transfer_contract_tokens>) {
                return on_transfer_contract_tokens(ctx, value);
            } else {
                return {};
            }
        }, param);
    }

    auto storage() const -> boost::json::value override {
        return codec::encode(snapshot());
    }

    auto clone() const -> std::unique_ptr<chain_emulator::contract> override {
        return std::make_unique<dao_contract>(*this);
    }

    auto registry_enabled() const -> bool { return _registry_enabled; }

protected:
    struct frozen_balance {
        std::uint64_t _stage{0};
        std::uint64_t _locked{0};
        // Frozen in _stage
        std::uint64_t _fresh{0};
        std::uint64_t _usable{0};
    };

    struct proposal_record {
        address _proposer;
        std::uint64_t _locked{0};
        proposal_metadata _metadata;
        level_t _level{0};
        std::uint64_t _voting_stage{0};
        std::uint64_t _up{0};
        std::uint64_t _down{0};
        // In voting order; one entry per voter
        std::vector<std::pair<address, std::uint64_t>> _voters;
    };

    virtual auto on_propose(const context& ctx, const propose& p) -> operations {
        auto stage = stage_at(ctx);
        if (stage % 2 != 1) {
            fail(ctx, error_code::not_proposing_stage);
        }
        if (!proposal_check(p._metadata)) {
            fail(ctx, error_code::fail_proposal_check);
        }
        if (p._frozen_token != _config._proposal_lock) {
            fail(ctx, error_code::wrong_token_amount);
        }
        if (_queue.size() >= _config._max_proposals) {
            fail(ctx, error_code::max_proposals_reached);
        }
        auto key = proposal_key_of(ctx.sender(), p);
        if (_proposals.find(key) != _proposals.end()) {
            fail(ctx, error_code::proposal_not_unique);
        }
        auto& balance = frozen_of(ctx, ctx.sender());
        if (balance._usable < p._frozen_token) {
            fail_with(ctx, error_code::not_enough_frozen_tokens, p._frozen_token, balance._usable);
        }
        balance._usable -= p._frozen_token;
        balance._locked += p._frozen_token;

        proposal_record record;
        record._proposer = ctx.sender();
        record._locked = p._frozen_token;
        record._metadata = p._metadata;
        record._level = ctx.level();
        record._voting_stage = stage + 1;
        _proposals.emplace(key, std::move(record));
        _queue.push_back(key);
        return {};
    }

    virtual auto on_vote(const context& ctx, const vote& v) -> operations {
        auto it = _proposals.find(v._proposal_key);
        if (it == _proposals.end()) {
            fail(ctx, error_code::proposal_not_exist);
        }
        auto& record = it->second;
        if (stage_at(ctx) != record._voting_stage) {
            fail(ctx, error_code::voting_stage_over);
        }
        if (v._vote_amount == 0) {
            fail(ctx, error_code::bad_entrypoint_parameter);
        }
        auto& balance = frozen_of(ctx, ctx.sender());
        if (balance._usable < v._vote_amount) {
            fail_with(ctx, error_code::not_enough_frozen_tokens, v._vote_amount, balance._usable);
        }
        balance._usable -= v._vote_amount;
        balance._locked += v._vote_amount;

        (v._upvote ? record._up : record._down) += v._vote_amount;
        auto voter = std::find_if(record._voters.begin(), record._voters.end(),
            [&ctx](const auto& entry) { return entry.first == ctx.sender(); });
        if (voter == record._voters.end()) {
            record._voters.emplace_back(ctx.sender(), v._vote_amount);
        } else {
            voter->second += v._vote_amount;
        }
        return {};
    }

    virtual auto on_freeze(const context& ctx, const freeze& f) -> operations {
        if (f._amount == 0) {
            fail(ctx, error_code::bad_entrypoint_parameter);
        }
        auto& balance = frozen_of(ctx, ctx.sender());
        balance._fresh += f._amount;
        _frozen_total += f._amount;
        return {token_transfer_call(ctx.sender(), ctx.self(), f._amount)};
    }

    virtual auto on_unfreeze(const context& ctx, const unfreeze& u) -> operations {
        if (u._amount == 0) {
            fail(ctx, error_code::bad_entrypoint_parameter);
        }
        auto& balance = frozen_of(ctx, ctx.sender());
        if (balance._usable < u._amount) {
            fail_with(ctx, error_code::not_enough_frozen_tokens, u._amount, balance._usable);
        }
        balance._usable -= u._amount;
        _frozen_total -= u._amount;
        return {token_transfer_call(ctx.self(), ctx.sender(), u._amount)};
    }

    virtual auto on_flush(const context& ctx, const flush& f) -> operations {
        if (f._count == 0) {
            fail(ctx, error_code::bad_entrypoint_parameter);
        }
        auto stage = stage_at(ctx);
        auto spendable = ctx.balance();
        operations emitted;
        std::uint64_t done = 0;

        for (; done < f._count && !_queue.empty(); ++done) {
            const auto key = _queue.front();
            auto record = _proposals.at(key);
            if (record._voting_stage >= stage) {
                break;
            }

            const bool passed = record._up + record._down >= _config._quorum && record._up > record._down;
            if (passed) {
                execute(ctx, record._metadata, spendable, emitted);
            }

            std::uint64_t slashed = 0;
            if (!passed && _config._slash_divisor != 0) {
                slashed = record._locked / _config._slash_divisor;
            }
            auto& proposer = frozen_of(ctx, record._proposer);
            proposer._locked -= record._locked;
            proposer._usable += record._locked - slashed;
            _frozen_total -= slashed;
            unlock_voters(ctx, record);

            _proposals.erase(key);
            _queue.pop_front();
        }

        if (done == 0) {
            fail(ctx, error_code::empty_flush);
        }
        return emitted;
    }

    virtual auto on_drop_proposal(const context& ctx, const drop_proposal& d) -> operations {
        auto it = _proposals.find(d._proposal_key);
        if (it == _proposals.end()) {
            fail(ctx, error_code::proposal_not_exist);
        }
        auto record = it->second;
        const bool expired = stage_at(ctx) >= record._voting_stage + 2;
        const bool allowed = ctx.sender() == record._proposer || ctx.sender() == _guardian || expired;
        if (!allowed) {
            fail(ctx, error_code::drop_proposal_condition_not_met);
        }

        auto& proposer = frozen_of(ctx, record._proposer);
        proposer._locked -= record._locked;
        proposer._usable += record._locked;
        unlock_voters(ctx, record);

        _proposals.erase(it);
        _queue.erase(std::remove(_queue.begin(), _queue.end(), d._proposal_key), _queue.end());
        return {};
    }

    virtual auto on_transfer_ownership(const context& ctx, const transfer_ownership& t) -> operations {
        if (ctx.sender() != _admin) {
            fail(ctx, error_code::not_admin);
        }
        _pending_owner = t._new_owner;
        return {};
    }

    virtual auto on_accept_ownership(const context& ctx, [[maybe_unused]] const accept_ownership& a) -> operations {
        if (ctx.sender() != _pending_owner) {
            fail(ctx, error_code::not_pending_admin);
        }
        _admin = ctx.sender();
        return {};
    }

    virtual auto on_transfer_contract_tokens(const context& ctx, const transfer_contract_tokens& t) -> operations {
        if (ctx.sender() != _admin) {
            fail(ctx, error_code::not_admin);
        }
        if (t._contract != _governance_token) {
            fail(ctx, error_code::fail_transfer_contract_tokens);
        }
        return {token_transfer_call(ctx.self(), t._receiver, t._amount)};
    }

    virtual auto on_lookup_registry([[maybe_unused]] const context& ctx, const lookup_registry& l) -> operations {
        std::optional<std::string> found;
        if (auto it = _registry.find(l._key); it != _registry.end()) {
            found = it->second;
        }
        chain_emulator::internal_operation op;
        op._destination = l._view;
        op._entrypoint = "default";
        op._parameter = codec::encode_lookup(l._key, found);
        op._amount = 0;
        return {std::move(op)};
    }

    [[noreturn]] static auto fail(const context& ctx, error_code code) -> void {
        throw chain_emulator::failwith_exception(ctx.self(), chain_emulator::int_value(static_cast<std::uint64_t>(code)));
    }

    // (tag, (required, present)) for balance errors
    [[noreturn]] static auto fail_with(const context& ctx, error_code code, std::uint64_t required, std::uint64_t present)
        -> void {
        throw chain_emulator::failwith_exception(ctx.self(), chain_emulator::pair_value(
            chain_emulator::int_value(static_cast<std::uint64_t>(code)),
            chain_emulator::pair_value(chain_emulator::int_value(required), chain_emulator::int_value(present))));
    }

    auto frozen_of(const context& ctx, const address& owner) -> frozen_balance& {
        auto& balance = _frozen[owner];
        auto stage = stage_at(ctx);
        if (balance._stage < stage) {
            balance._usable += balance._fresh;
            balance._fresh = 0;
            balance._stage = stage;
        }
        return balance;
    }

    auto stage_at(const context& ctx) const -> std::uint64_t {
        return stage_of(ctx.level(), _start_level, _config._period);
    }

    auto token_transfer_call(const address& from, const address& to, std::uint64_t amount) const
        -> chain_emulator::internal_operation {
        transfer_batch batch;
        batch._from = from;
        batch._txs.push_back(transfer_destination{to, _token_id, amount});

        chain_emulator::internal_operation op;
        op._destination = _governance_token;
        op._entrypoint = "transfer";
        op._parameter = codec::transfer_argument(batch);
        op._amount = 0;
        return op;
    }

    bool _registry_enabled;
    address _admin;
    address _pending_owner;
    address _guardian;
    address _governance_token;
    std::uint64_t _token_id{0};
    level_t _start_level{0};
    dao_config _config;
    std::uint64_t _frozen_total{0};
    std::unordered_map<address, frozen_balance> _frozen;
    std::unordered_map<std::string, proposal_record> _proposals;
    std::deque<std::string> _queue;
    std::unordered_map<std::string, std::string> _registry;

private:
    auto dispatch_custom(const context& ctx, std::string_view entrypoint, const boost::json::value& argument)
        -> operations {
        registry_parameter param;
        try {
            param = codec::decode_registry_parameter(entrypoint, argument);
        } catch (const serialization_exception& e) {
            throw chain_emulator::bad_parameter_exception(ctx.self(), e.what());
        }
        if (const auto* lookup = std::get_if<lookup_registry>(&param)) {
            return on_lookup_registry(ctx, *lookup);
        }
        return {};
    }

    auto proposal_check(const proposal_metadata& metadata) const -> bool {
        if (const auto* text = std::get_if<text_metadata>(&metadata)) {
            return !text->_text.empty();
        }
        if (const auto* xtz = std::get_if<xtz_transfer>(&metadata)) {
            return xtz->_amount >= _config._min_xtz_amount && xtz->_amount <= _config._max_xtz_amount;
        }
        if (const auto* tokens = std::get_if<token_transfer>(&metadata)) {
            return tokens->_amount != 0;
        }
        const auto& update = std::get<registry_update>(metadata);
        return _registry_enabled && !update._key.empty();
    }

    // Effects of an accepted proposal; tez and token transfers are emitted
    auto execute(const context& ctx, const proposal_metadata& metadata, mutez& spendable, operations& emitted) -> void {
        if (const auto* xtz = std::get_if<xtz_transfer>(&metadata)) {
            if (spendable < xtz->_amount) {
                fail_with(ctx, error_code::insufficient_xtz_balance, xtz->_amount, spendable);
            }
            spendable -= xtz->_amount;
            chain_emulator::internal_operation op;
            op._destination = xtz->_receiver;
            op._entrypoint = "default";
            op._parameter = chain_emulator::unit_value();
            op._amount = xtz->_amount;
            emitted.push_back(std::move(op));
        } else if (const auto* tokens = std::get_if<token_transfer>(&metadata)) {
            emitted.push_back(token_transfer_call(ctx.self(), tokens->_receiver, tokens->_amount));
        } else if (const auto* update = std::get_if<registry_update>(&metadata)) {
            if (update->_value) {
                _registry[update->_key] = *update->_value;
            } else {
                _registry.erase(update->_key);
            }
        }
    }

    auto unlock_voters(const context& ctx, const proposal_record& record) -> void {
        for (const auto& [voter, amount] : record._voters) {
            auto& balance = frozen_of(ctx, voter);
            balance._locked -= amount;
            balance._usable += amount;
        }
    }

    auto load(const dao::storage& st) -> void {
        _admin = st._admin;
        _pending_owner = st._pending_owner;
        _guardian = st._guardian;
        _governance_token = st._governance_token;
        _token_id = st._token_id;
        _start_level = st._start_level;
        _config = st._config;
        _frozen_total = st._frozen_total_supply;
        for (const auto& [owner, record] : st._freeze_history) {
            _frozen[owner] = frozen_balance{
                record._current_stage, record._staked, record._current_unstaked, record._past_unstaked};
        }
        for (const auto& [key, p] : st._proposals) {
            proposal_record record;
            record._proposer = p._proposer;
            record._locked = p._frozen_token;
            record._metadata = p._metadata;
            record._level = p._start_level;
            record._voting_stage = p._voting_stage;
            record._up = p._upvotes;
            record._down = p._downvotes;
            record._voters.assign(p._voter_stakes.begin(), p._voter_stakes.end());
            _proposals.emplace(key, std::move(record));
        }
        _queue.assign(st._ongoing.begin(), st._ongoing.end());
        _registry.insert(st._registry.begin(), st._registry.end());
    }

    // The shared storage shape
    auto snapshot() const -> dao::storage {
        dao::storage st;
        st._admin = _admin;
        st._pending_owner = _pending_owner;
        st._guardian = _guardian;
        st._governance_token = _governance_token;
        st._token_id = _token_id;
        st._start_level = _start_level;
        st._config = _config;
        st._frozen_total_supply = _frozen_total;
        for (const auto& [owner, balance] : _frozen) {
            st._freeze_history[owner] = freeze_record{balance._stage, balance._locked, balance._fresh, balance._usable};
        }
        for (const auto& [key, record] : _proposals) {
            proposal p;
            p._proposer = record._proposer;
            p._frozen_token = record._locked;
            p._metadata = record._metadata;
            p._start_level = record._level;
            p._voting_stage = record._voting_stage;
            p._upvotes = record._up;
            p._downvotes = record._down;
            p._voter_stakes.insert(record._voters.begin(), record._voters.end());
            st._proposals.emplace(key, std::move(p));
        }
        st._ongoing.assign(_queue.begin(), _queue.end());
        st._registry.insert(_registry.begin(), _registry.end());
        return st;
    }
};

} // namespace lockstep::dao
