// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "jump_table.hpp"
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace evmeter
{
/// The feature activator: modifies the draft table to enable a protocol change.
///
/// Activators are idempotent: applying one to a table it has already been applied to
/// leaves the table unchanged.
using Activator = void (*)(OperationTable& table) noexcept;

/// Activators of the supported Ethereum EIPs.
/// @{
void activate_eip1344(OperationTable& table) noexcept;  ///< CHAINID.
void activate_eip1884(OperationTable& table) noexcept;  ///< Trie-size-dependent repricing, SELFBALANCE.
void activate_eip2200(OperationTable& table) noexcept;  ///< Net gas metering of SSTORE.
void activate_eip2929(OperationTable& table) noexcept;  ///< Cold/warm state access costs.
void activate_eip3198(OperationTable& table) noexcept;  ///< BASEFEE.
void activate_eip3529(OperationTable& table) noexcept;  ///< Reduction in refunds.
void activate_eip3855(OperationTable& table) noexcept;  ///< PUSH0.
void activate_eip3860(OperationTable& table) noexcept;  ///< Initcode size limit and metering.
void activate_eip5656(OperationTable& table) noexcept;  ///< MCOPY.
/// @}

enum class FeatureError
{
    /// The identifier is not of the form <namespace>_<number>.
    malformed_name,

    /// The identifier is well-formed but not registered.
    unknown_feature,

    /// A descriptor's stack bounds contradict the opcode's stack effect.
    stack_bounds_mismatch,
};

[[nodiscard]] std::string_view get_error_message(FeatureError error) noexcept;

std::ostream& operator<<(std::ostream& os, FeatureError error) noexcept;

/// The failure of a table build.
struct ConfigError
{
    FeatureError error;

    /// The offending feature identifier or instruction name.
    std::string subject;
};

std::ostream& operator<<(std::ostream& os, const ConfigError& error);

/// Checks if the feature identifier has the form <namespace>_<number>:
/// exactly one underscore followed by a decimal integer (optionally signed).
[[nodiscard]] bool validate_feature_name(std::string_view name) noexcept;

/// Splits the comma-separated list of feature identifiers.
/// Whitespace around identifiers is trimmed and empty entries are skipped.
[[nodiscard]] std::vector<std::string> parse_feature_list(std::string_view list);


/// The immutable mapping of feature identifiers to their activators.
///
/// The registration order is the protocol-historical order of the features. The builder
/// applies the requested features in this order, whatever the order of the request.
class FeatureRegistry
{
public:
    struct Feature
    {
        std::string name;
        Activator activate = nullptr;
    };

private:
    std::vector<Feature> m_features;

    [[nodiscard]] const Feature* find_feature(std::string_view name) const noexcept;

public:
    /// Creates the registry of the features, given in protocol-historical order.
    ///
    /// @throws std::invalid_argument  If a name is malformed or registered twice,
    ///                                or an activator is missing.
    explicit FeatureRegistry(std::vector<Feature> features);

    /// The registry of the features enabled in the current protocol configuration.
    static FeatureRegistry create_default();

    /// The default registry extended with the dormant features.
    static FeatureRegistry create_with_dormant();

    /// Returns the activator of the feature or nullptr if not registered.
    [[nodiscard]] Activator find(std::string_view name) const noexcept;

    [[nodiscard]] bool contains(std::string_view name) const noexcept
    {
        return find(name) != nullptr;
    }

    /// The registered features in protocol-historical order.
    [[nodiscard]] const std::vector<Feature>& features() const noexcept { return m_features; }

    /// The registered identifiers sorted by name.
    [[nodiscard]] std::vector<std::string> activatable_features() const;

    /// Builds the dispatch table from the base table by applying the requested features.
    ///
    /// All identifiers are validated before any activator runs. Duplicated identifiers are
    /// applied once. The draft is consumed: the result is either the frozen table or the error
    /// naming the first malformed or unregistered identifier.
    [[nodiscard]] std::variant<JumpTablePtr, ConfigError> build(
        OperationTable base, std::span<const std::string> names) const;

    /// Builds the table from make_base_table().
    [[nodiscard]] std::variant<JumpTablePtr, ConfigError> build(
        std::span<const std::string> names) const
    {
        return build(make_base_table(), names);
    }
};

/// The features of FeatureRegistry::create_default() in protocol-historical order.
[[nodiscard]] std::vector<FeatureRegistry::Feature> default_features();

/// The implemented features not enabled by default: ethereum_3860.
[[nodiscard]] std::vector<FeatureRegistry::Feature> dormant_features();
}  // namespace evmeter
