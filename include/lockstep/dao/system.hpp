#pragma once

#include <lockstep/dao/codec.hpp>
#include <lockstep/dao/types.hpp>
#include <lockstep/error_normalizer.hpp>
#include <lockstep/exceptions.hpp>
#include <lockstep/system_executor.hpp>
#include <lockstep/types.hpp>

#include <chain_emulator/client.hpp>
#include <chain_emulator/exceptions.hpp>

#include <folly/futures/Future.h>

#include <boost/json.hpp>

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace lockstep::dao {

// How FAILWITH values reach the engine
enum class failure_encoding : std::uint8_t {
    // Numeric tags and (tag, detail) pairs are recognized client side
    typed,
    // Every value is passed on as raw Micheline, like a node RPC reports it
    expression
};

inline auto operator<<(std::ostream& os, failure_encoding encoding) -> std::ostream& {
    switch (encoding) {
        case failure_encoding::typed: return os << "typed";
        case failure_encoding::expression: return os << "expression";
    }
    return os << "unknown";
}

enum class auxiliary_kind : std::uint8_t {
    token_ledger,
    lookup_log
};

// The DAO deployed on an emulated chain, seen through the system_client
// interface. Auxiliary entities must be registered with their storage kind
// before the client is handed to an executor; copies share the chain but
// not later registrations.
template<typename Custom>
class system_client {
public:
    using domain_type = domain<Custom>;

    explicit system_client(
        chain_emulator::chain_client client,
        failure_encoding encoding = failure_encoding::typed
    )
        : _client(std::move(client))
        , _encoding(encoding) {}

    auto register_auxiliary(const entity_handle& handle, auxiliary_kind kind) -> void {
        _auxiliary[handle] = kind;
    }

    auto advance_level(level_t levels) -> folly::Future<folly::Unit> {
        return _client.advance_level(levels);
    }

    auto fund(const entity_handle& account, mutez amount) -> folly::Future<folly::Unit> {
        return _client.credit(account.value(), amount);
    }

    auto submit(const entity_handle& target, const entity_handle& sender, mutez amount, const parameter& param)
        -> folly::Future<submission_result> {
        return submit_call(target, sender, amount, codec::encode(param));
    }

    // Submits an already encoded entrypoint call
    auto submit_call(const entity_handle& target, const entity_handle& sender, mutez amount, entrypoint_call call)
        -> folly::Future<submission_result> {
        return _client.transfer(sender.value(), target.value(), call._entrypoint, std::move(call._argument), amount)
            .thenValue([](folly::Unit) { return submission_result{}; })
            .thenError(folly::tag_t<chain_emulator::failwith_exception>{},
                [encoding = _encoding](const chain_emulator::failwith_exception& e) {
                    return submission_result{translate(encoding, e.get_value())};
                })
            .thenError(folly::tag_t<chain_emulator::chain_exception>{},
                [](const chain_emulator::chain_exception& e) {
                    return submission_result{raw_failure{transport_failure{transport_failure_kind::rejected, e.what()}}};
                });
    }

    auto get_storage(const entity_handle& handle) -> folly::Future<storage> {
        return _client.storage(handle.value())
            .thenValue([](boost::json::value value) { return codec::decode_storage(value); });
    }

    auto get_auxiliary_storage(const entity_handle& handle) -> folly::Future<auxiliary_storage> {
        auto it = _auxiliary.find(handle);
        if (it == _auxiliary.end()) {
            return folly::makeFuture<auxiliary_storage>(missing_entity_exception("system", handle.value()));
        }
        return _client.storage(handle.value())
            .thenValue([kind = it->second](boost::json::value value) -> auxiliary_storage {
                if (kind == auxiliary_kind::token_ledger) {
                    return codec::decode_token_ledger(value);
                }
                return codec::decode_lookup_log(value);
            });
    }

    auto get_balance(const entity_handle& handle) -> folly::Future<mutez> {
        return _client.balance(handle.value());
    }

    auto client() -> chain_emulator::chain_client& { return _client; }
    auto encoding() const -> failure_encoding { return _encoding; }

private:
    static auto translate(failure_encoding encoding, const boost::json::value& value) -> raw_failure {
        if (encoding == failure_encoding::expression) {
            return failed_with_expression{value};
        }
        if (auto code = as_int(value)) {
            return failed_with_code{*code};
        }
        if (value.is_object()) {
            const auto& obj = value.as_object();
            const auto* prim = obj.if_contains("prim");
            const auto* args = obj.if_contains("args");
            if (prim != nullptr && prim->is_string() && prim->as_string() == "Pair" &&
                args != nullptr && args->is_array() && args->as_array().size() == 2) {
                if (auto code = as_int(args->as_array()[0])) {
                    return failed_with_pair{*code, args->as_array()[1]};
                }
            }
        }
        return failed_with_expression{value};
    }

    static auto as_int(const boost::json::value& value) -> std::optional<std::uint64_t> {
        if (!value.is_object()) {
            return std::nullopt;
        }
        const auto* digits = value.as_object().if_contains("int");
        if (digits == nullptr || !digits->is_string()) {
            return std::nullopt;
        }
        std::string_view text = digits->as_string();
        std::uint64_t code = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), code);
        if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
            return std::nullopt;
        }
        return code;
    }

    chain_emulator::chain_client _client;
    failure_encoding _encoding;
    std::map<entity_handle, auxiliary_kind> _auxiliary;
};

// Submits lookup_registry; update_receivers has no counterpart on chain and
// falls under the engine's custom entrypoint policy
struct registry_dispatch {
    auto supports(const registry_parameter& param) const -> bool {
        return std::holds_alternative<lookup_registry>(param);
    }

    auto dispatch(
        system_client<registry_parameter>& client,
        const entity_handle& target,
        const entity_handle& sender,
        mutez amount,
        const registry_parameter& param
    ) const -> folly::Future<submission_result> {
        return client.submit_call(target, sender, amount, codec::encode(param));
    }
};

static_assert(lockstep::system_client<system_client<no_custom_entrypoint>, base_domain>);
static_assert(lockstep::system_client<system_client<registry_parameter>, registry_domain>);
static_assert(custom_entrypoint_dispatch<registry_dispatch, system_client<registry_parameter>, registry_domain>);

} // namespace lockstep::dao
