/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * summary.cpp - Snapshot of a switchtec device's identity
 */

#include <nlohmann/json.hpp>

#include "summary.hpp"

using json = nlohmann::json;

namespace libswitchtecpp
{

void to_json(json &j, const DeviceSummary &summary)
{
	j = json {
		{ "name", summary.name },
		{ "firmware_version", summary.firmware_version },
		{ "boot_phase", boot_phase_name(summary.boot_phase) },
		{ "generation", generation_name(summary.generation) },
		{ "partition", summary.partition },
	};
}

std::ostream &operator<<(std::ostream &os, const DeviceSummary &summary)
{
	return os << "Name:       " << summary.name << "\n"
			  << "Firmware:   " << summary.firmware_version << "\n"
			  << "Boot phase: " << summary.boot_phase << "\n"
			  << "Generation: " << summary.generation << "\n"
			  << "Partition:  " << summary.partition << "\n";
}

} // namespace libswitchtecpp
