/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * boundary.cpp - Calls into the switchtec-user control library
 */

#include "boundary.hpp"

namespace libswitchtecpp
{

std::mutex &boundary_mutex()
{
	static std::mutex mutex;
	return mutex;
}

BootPhase boot_phase_from_raw(int raw)
{
	switch (raw)
	{
	case RawBootPhaseBl1:
		return BootPhase::Bl1;
	case RawBootPhaseBl2:
		return BootPhase::Bl2;
	case RawBootPhaseFw:
		return BootPhase::Fw;
	default:
		return BootPhase::Unknown;
	}
}

Generation generation_from_raw(int raw)
{
	switch (raw)
	{
	case RawGen3:
		return Generation::Gen3;
	case RawGen4:
		return Generation::Gen4;
	case RawGen5:
		return Generation::Gen5;
	default:
		return Generation::Unknown;
	}
}

const char *boot_phase_name(BootPhase phase)
{
	switch (phase)
	{
	case BootPhase::Bl1:
		return "BL1";
	case BootPhase::Bl2:
		return "BL2";
	case BootPhase::Fw:
		return "FW";
	case BootPhase::Unknown:
		break;
	}

	return "UNKNOWN";
}

const char *generation_name(Generation gen)
{
	switch (gen)
	{
	case Generation::Gen3:
		return "GEN3";
	case Generation::Gen4:
		return "GEN4";
	case Generation::Gen5:
		return "GEN5";
	case Generation::Unknown:
		break;
	}

	return "UNKNOWN";
}

std::ostream &operator<<(std::ostream &os, BootPhase phase)
{
	return os << boot_phase_name(phase);
}

std::ostream &operator<<(std::ostream &os, Generation gen)
{
	return os << generation_name(gen);
}

} // namespace libswitchtecpp
