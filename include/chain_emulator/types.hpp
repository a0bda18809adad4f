#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chain_emulator {

// Implicit accounts start with "tz", originated contracts with "KT1"
using address = std::string;
using mutez = std::uint64_t;
using level_t = std::uint64_t;

// Internal operations one external transfer may run, itself included
constexpr std::size_t max_operations_per_transfer = 1000;

inline auto is_contract_address(std::string_view addr) -> bool {
    return addr.starts_with("KT1");
}

// What a contract sees while executing one call
struct call_context {
    // Immediate caller
    address _sender;
    // Implicit account that signed the external transfer
    address _source;
    address _self;
    mutez _amount{0};
    // Balance of self, amount included
    mutez _balance{0};
    level_t _level{0};

    auto sender() const -> const address& { return _sender; }
    auto source() const -> const address& { return _source; }
    auto self() const -> const address& { return _self; }
    auto amount() const -> mutez { return _amount; }
    auto balance() const -> mutez { return _balance; }
    auto level() const -> level_t { return _level; }
};

// Transfer emitted by a contract; runs after the emitting call, depth first
struct internal_operation {
    address _destination;
    std::string _entrypoint{"default"};
    boost::json::value _parameter;
    mutez _amount{0};

    auto destination() const -> const address& { return _destination; }
    auto entrypoint() const -> const std::string& { return _entrypoint; }
    auto parameter() const -> const boost::json::value& { return _parameter; }
    auto amount() const -> mutez { return _amount; }
};

using operation_list = std::vector<internal_operation>;

// Micheline helpers
inline auto unit_value() -> boost::json::value {
    return boost::json::object{{"prim", "Unit"}};
}

inline auto int_value(std::uint64_t value) -> boost::json::value {
    return boost::json::object{{"int", std::to_string(value)}};
}

inline auto string_value(std::string_view value) -> boost::json::value {
    return boost::json::object{{"string", value}};
}

inline auto pair_value(boost::json::value first, boost::json::value second) -> boost::json::value {
    return boost::json::object{
        {"prim", "Pair"},
        {"args", boost::json::array{std::move(first), std::move(second)}}
    };
}

} // namespace chain_emulator
