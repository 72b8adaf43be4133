// evmeter: EVM opcode dispatch and gas metering
// Copyright 2026 The evmeter Authors.
// SPDX-License-Identifier: Apache-2.0

#include "eips.hpp"
#include <evmeter/evmeter.h>

namespace evmeter
{
const char* version() noexcept
{
    return PROJECT_VERSION;
}

const FeatureRegistry& default_registry()
{
    static const auto registry = FeatureRegistry::create_default();
    return registry;
}
}  // namespace evmeter
