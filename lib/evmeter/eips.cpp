// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "eips.hpp"
#include "instructions.hpp"
#include <algorithm>
#include <charconv>
#include <optional>
#include <ostream>
#include <stdexcept>

namespace evmeter
{
namespace
{
/// Installs the descriptor of a new opcode. Reinstalling the same descriptor is a no-op.
void install(OperationTable& table, Opcode opcode, const Operation& operation) noexcept
{
    if (table[opcode] != operation)
        table[opcode] = operation;
}

void set_access_list_call(OperationTable& table, Opcode opcode, DynamicGasFn fn) noexcept
{
    table[opcode].constant_gas = instr::warm_storage_read_cost;
    table[opcode].dynamic_gas = fn;
}
}  // namespace

void activate_eip1344(OperationTable& table) noexcept
{
    install(table, OP_CHAINID, make_operation(OP_CHAINID, instr::core::chainid, instr::gas_quick_step));
}

void activate_eip1884(OperationTable& table) noexcept
{
    table[OP_SLOAD].constant_gas = instr::sload_gas_eip1884;
    table[OP_BALANCE].constant_gas = instr::balance_gas_eip1884;
    table[OP_EXTCODEHASH].constant_gas = instr::extcodehash_gas_eip1884;
    install(table, OP_SELFBALANCE,
        make_operation(OP_SELFBALANCE, instr::core::selfbalance, instr::gas_fast_step));
}

void activate_eip2200(OperationTable& table) noexcept
{
    table[OP_SLOAD].constant_gas = instr::sload_gas_eip2200;
    table[OP_SSTORE].dynamic_gas = instr::gas::sstore<instr::gas::SstoreSchedule::eip2200>;
}

void activate_eip2929(OperationTable& table) noexcept
{
    using namespace instr::gas;

    table[OP_SSTORE].dynamic_gas = sstore<SstoreSchedule::eip2929>;

    table[OP_SLOAD].constant_gas = 0;
    table[OP_SLOAD].dynamic_gas = sload_eip2929;

    table[OP_EXTCODECOPY].constant_gas = instr::warm_storage_read_cost;
    table[OP_EXTCODECOPY].dynamic_gas = extcodecopy_eip2929;

    for (const auto op : {OP_BALANCE, OP_EXTCODESIZE, OP_EXTCODEHASH})
    {
        table[op].constant_gas = instr::warm_storage_read_cost;
        table[op].dynamic_gas = account_check_eip2929;
    }

    set_access_list_call(table, OP_CALL, call_eip2929<call>);
    set_access_list_call(table, OP_CALLCODE, call_eip2929<callcode>);
    set_access_list_call(table, OP_DELEGATECALL, call_eip2929<delegatecall>);
    set_access_list_call(table, OP_STATICCALL, call_eip2929<staticcall>);

    table[OP_SELFDESTRUCT].constant_gas = instr::selfdestruct_gas_eip150;
    table[OP_SELFDESTRUCT].dynamic_gas = selfdestruct_eip2929<true>;
}

void activate_eip3198(OperationTable& table) noexcept
{
    install(table, OP_BASEFEE, make_operation(OP_BASEFEE, instr::core::basefee, instr::gas_quick_step));
}

void activate_eip3529(OperationTable& table) noexcept
{
    table[OP_SSTORE].dynamic_gas = instr::gas::sstore<instr::gas::SstoreSchedule::eip3529>;
    table[OP_SELFDESTRUCT].dynamic_gas = instr::gas::selfdestruct_eip2929<false>;
}

void activate_eip3855(OperationTable& table) noexcept
{
    install(table, OP_PUSH0, make_operation(OP_PUSH0, instr::core::push0, instr::gas_quick_step));
}

void activate_eip3860(OperationTable& table) noexcept
{
    table[OP_CREATE].dynamic_gas = instr::gas::create_eip3860;
    table[OP_CREATE2].dynamic_gas = instr::gas::create2_eip3860;
}

void activate_eip5656(OperationTable& table) noexcept
{
    install(table, OP_MCOPY, make_operation(OP_MCOPY, instr::core::mcopy, 0, instr::gas::mcopy));
}


std::string_view get_error_message(FeatureError error) noexcept
{
    switch (error)
    {
    case FeatureError::malformed_name:
        return "malformed feature name";
    case FeatureError::unknown_feature:
        return "unknown feature";
    case FeatureError::stack_bounds_mismatch:
        return "stack bounds mismatch";
    }
    return "<unknown>";
}

std::ostream& operator<<(std::ostream& os, FeatureError error) noexcept
{
    os << get_error_message(error);
    return os;
}

std::ostream& operator<<(std::ostream& os, const ConfigError& error)
{
    return os << error.error << ": " << error.subject;
}

bool validate_feature_name(std::string_view name) noexcept
{
    const auto sep = name.find('_');
    if (sep == std::string_view::npos)
        return false;

    auto number = name.substr(sep + 1);
    if (number.find('_') != std::string_view::npos)
        return false;

    if (!number.empty() && number.front() == '+')
        number.remove_prefix(1);
    if (number.empty() || number.front() == '+')
        return false;

    int value = 0;
    const auto end = number.data() + number.size();
    const auto [ptr, ec] = std::from_chars(number.data(), end, value);
    return ec == std::errc{} && ptr == end;
}

std::vector<std::string> parse_feature_list(std::string_view list)
{
    static constexpr std::string_view whitespace = " \t\n\r";

    std::vector<std::string> names;
    while (!list.empty())
    {
        const auto comma = list.find(',');
        auto item = list.substr(0, comma);
        list = (comma == std::string_view::npos) ? std::string_view{} : list.substr(comma + 1);

        const auto first = item.find_first_not_of(whitespace);
        if (first == std::string_view::npos)
            continue;
        item = item.substr(first, item.find_last_not_of(whitespace) - first + 1);
        names.emplace_back(item);
    }
    return names;
}


namespace
{
struct KnownFeature
{
    std::string_view name;
    Activator activate;
    bool dormant;
};

/// All implemented features in protocol-historical order.
constexpr KnownFeature known_features[] = {
    {"ethereum_1344", activate_eip1344, false},
    {"ethereum_1884", activate_eip1884, false},
    {"ethereum_2200", activate_eip2200, false},
    {"ethereum_2929", activate_eip2929, false},
    {"ethereum_3198", activate_eip3198, false},
    {"ethereum_3529", activate_eip3529, false},
    {"ethereum_3855", activate_eip3855, false},
    {"ethereum_3860", activate_eip3860, true},
    {"ethereum_5656", activate_eip5656, false},
};

std::vector<FeatureRegistry::Feature> select_features(bool with_dormant, bool with_active)
{
    std::vector<FeatureRegistry::Feature> features;
    for (const auto& f : known_features)
    {
        if (f.dormant ? with_dormant : with_active)
            features.push_back({std::string{f.name}, f.activate});
    }
    return features;
}

/// Checks the stack bounds of every defined descriptor against the instruction traits.
/// Returns the name of the first mismatching instruction.
std::optional<std::string> find_stack_bounds_mismatch(const OperationTable& table)
{
    for (size_t op = 0; op < table.size(); ++op)
    {
        const auto& operation = table[op];
        if (!operation.is_defined())
            continue;

        const auto& tr = instr::traits[op];
        if (tr.name == nullptr)
            return "opcode " + std::to_string(op);
        if (operation.min_stack != instr::min_stack(tr) ||
            operation.max_stack != instr::max_stack(tr))
            return tr.name;
    }
    return std::nullopt;
}
}  // namespace

std::vector<FeatureRegistry::Feature> default_features()
{
    return select_features(false, true);
}

std::vector<FeatureRegistry::Feature> dormant_features()
{
    return select_features(true, false);
}

FeatureRegistry::FeatureRegistry(std::vector<Feature> features) : m_features{std::move(features)}
{
    for (auto it = m_features.begin(); it != m_features.end(); ++it)
    {
        if (!validate_feature_name(it->name))
            throw std::invalid_argument{"malformed feature name: " + it->name};
        if (it->activate == nullptr)
            throw std::invalid_argument{"missing activator of " + it->name};
        if (std::any_of(m_features.begin(), it, [&](const Feature& f) { return f.name == it->name; }))
            throw std::invalid_argument{"feature registered twice: " + it->name};
    }
}

FeatureRegistry FeatureRegistry::create_default()
{
    return FeatureRegistry{default_features()};
}

FeatureRegistry FeatureRegistry::create_with_dormant()
{
    return FeatureRegistry{select_features(true, true)};
}

const FeatureRegistry::Feature* FeatureRegistry::find_feature(std::string_view name) const noexcept
{
    const auto it = std::find_if(
        m_features.begin(), m_features.end(), [name](const Feature& f) { return f.name == name; });
    return it != m_features.end() ? &*it : nullptr;
}

Activator FeatureRegistry::find(std::string_view name) const noexcept
{
    const auto* feature = find_feature(name);
    return feature != nullptr ? feature->activate : nullptr;
}

std::vector<std::string> FeatureRegistry::activatable_features() const
{
    std::vector<std::string> names;
    names.reserve(m_features.size());
    for (const auto& f : m_features)
        names.push_back(f.name);
    std::sort(names.begin(), names.end());
    return names;
}

std::variant<JumpTablePtr, ConfigError> FeatureRegistry::build(
    OperationTable base, std::span<const std::string> names) const
{
    std::vector<bool> requested(m_features.size(), false);
    for (const auto& name : names)
    {
        if (!validate_feature_name(name))
            return ConfigError{FeatureError::malformed_name, name};

        const auto* feature = find_feature(name);
        if (feature == nullptr)
            return ConfigError{FeatureError::unknown_feature, name};
        requested[static_cast<size_t>(feature - m_features.data())] = true;
    }

    for (size_t i = 0; i < m_features.size(); ++i)
    {
        if (requested[i])
            m_features[i].activate(base);
    }

    if (auto mismatch = find_stack_bounds_mismatch(base))
        return ConfigError{FeatureError::stack_bounds_mismatch, std::move(*mismatch)};

    return JumpTablePtr{new JumpTable{std::move(base)}};
}
}  // namespace evmeter
