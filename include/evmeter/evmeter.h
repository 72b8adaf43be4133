// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#ifndef EVMETER_H
#define EVMETER_H

#include <evmc/utils.h>

namespace evmeter
{
class FeatureRegistry;

/// The version of the evmeter library.
EVMC_EXPORT const char* version() noexcept;

/// Returns the registry of the features enabled by default.
/// It is created on first use and never modified afterwards.
EVMC_EXPORT const FeatureRegistry& default_registry();
}  // namespace evmeter

#endif  // EVMETER_H
