#pragma once

#include <chain_emulator/types.hpp>

#include <boost/json.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chain_emulator {

class chain_exception : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Contract code executed FAILWITH; carries the failed value as Micheline JSON
class failwith_exception : public chain_exception {
public:
    failwith_exception(const address& contract, boost::json::value value)
        : chain_exception("Contract " + contract + " failed with " + boost::json::serialize(value))
        , _contract(contract)
        , _value(std::move(value)) {}

    auto get_contract() const -> const address& { return _contract; }
    auto get_value() const -> const boost::json::value& { return _value; }

private:
    address _contract;
    boost::json::value _value;
};

class balance_too_low_exception : public chain_exception {
public:
    balance_too_low_exception(const address& account, mutez balance, mutez amount)
        : chain_exception("Balance of " + account + " too low: " + std::to_string(balance) +
                          " < " + std::to_string(amount)) {}
};

class unknown_contract_exception : public chain_exception {
public:
    explicit unknown_contract_exception(const address& contract)
        : chain_exception("Contract not found: " + contract) {}
};

class unknown_entrypoint_exception : public chain_exception {
public:
    unknown_entrypoint_exception(const address& contract, const std::string& entrypoint)
        : chain_exception("Contract " + contract + " has no entrypoint " + entrypoint) {}
};

class address_in_use_exception : public chain_exception {
public:
    explicit address_in_use_exception(const address& addr)
        : chain_exception("Address already in use: " + addr) {}
};

class operation_limit_exception : public chain_exception {
public:
    explicit operation_limit_exception(std::size_t limit)
        : chain_exception("Transfer exceeded the limit of " + std::to_string(limit) + " operations") {}
};

// Parameter or storage that does not match the contract's type
class bad_parameter_exception : public chain_exception {
public:
    bad_parameter_exception(const address& contract, const std::string& reason)
        : chain_exception("Ill-typed parameter for " + contract + ": " + reason) {}
};

} // namespace chain_emulator
