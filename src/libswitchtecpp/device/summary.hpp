/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * summary.hpp - Snapshot of a switchtec device's identity
 */
#pragma once

#include <ostream>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "boundary.hpp"

namespace libswitchtecpp
{

struct DeviceSummary
{
	std::string name;
	std::string firmware_version;
	BootPhase boot_phase = BootPhase::Unknown;
	Generation generation = Generation::Unknown;
	int partition = 0;
};

void to_json(nlohmann::json &j, const DeviceSummary &summary);

std::ostream &operator<<(std::ostream &os, const DeviceSummary &summary);

} // namespace libswitchtecpp
