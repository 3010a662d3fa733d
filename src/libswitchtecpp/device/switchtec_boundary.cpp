/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * switchtec_boundary.cpp - Boundary implementation over libswitchtec
 */

#include <switchtec/switchtec.h>

#include "boundary.hpp"

namespace libswitchtecpp
{

static_assert(SWITCHTEC_BOOT_PHASE_BL1 == RawBootPhaseBl1);
static_assert(SWITCHTEC_BOOT_PHASE_BL2 == RawBootPhaseBl2);
static_assert(SWITCHTEC_BOOT_PHASE_FW == RawBootPhaseFw);
static_assert(SWITCHTEC_GEN3 == RawGen3);
static_assert(SWITCHTEC_GEN4 == RawGen4);
static_assert(SWITCHTEC_GEN5 == RawGen5);

namespace {

class SwitchtecBoundary : public Boundary
{
public:
	switchtec_dev *Open(const char *path) override
	{
		return switchtec_open(path);
	}

	void Close(switchtec_dev *dev) override
	{
		switchtec_close(dev);
	}

	const char *LastError() override
	{
		return switchtec_strerror();
	}

	const char *Name(switchtec_dev *dev) override
	{
		return switchtec_name(dev);
	}

	int FirmwareVersion(switchtec_dev *dev, char *buf, std::size_t buflen) override
	{
		return switchtec_get_fw_version(dev, buf, buflen);
	}

	BootPhase GetBootPhase(switchtec_dev *dev) override
	{
		return boot_phase_from_raw(switchtec_boot_phase(dev));
	}

	Generation GetGeneration(switchtec_dev *dev) override
	{
		return generation_from_raw(switchtec_gen(dev));
	}

	int Partition(switchtec_dev *dev) override
	{
		return switchtec_partition(dev);
	}

	float DieTemperature(switchtec_dev *dev) override
	{
		return switchtec_die_temp(dev);
	}
};

} // namespace

Boundary &default_boundary()
{
	static SwitchtecBoundary boundary;
	return boundary;
}

} // namespace libswitchtecpp
