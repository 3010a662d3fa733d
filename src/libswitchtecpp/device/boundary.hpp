/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * boundary.hpp - Calls into the switchtec-user control library
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <ostream>

// Opaque session state owned by the switchtec-user library.
struct switchtec_dev;

namespace libswitchtecpp
{

enum class BootPhase
{
	Bl1,
	Bl2,
	Fw,
	Unknown
};

enum class Generation
{
	Gen3,
	Gen4,
	Gen5,
	Unknown
};

// Raw values of the C library's enum switchtec_boot_phase and enum switchtec_gen.
constexpr int RawBootPhaseBl1 = 1;
constexpr int RawBootPhaseBl2 = 2;
constexpr int RawBootPhaseFw = 3;

constexpr int RawGen3 = 0;
constexpr int RawGen4 = 1;
constexpr int RawGen5 = 2;

// Values the library reports beyond those above give Unknown.
BootPhase boot_phase_from_raw(int raw);
Generation generation_from_raw(int raw);

const char *boot_phase_name(BootPhase phase);
const char *generation_name(Generation gen);

std::ostream &operator<<(std::ostream &os, BootPhase phase);
std::ostream &operator<<(std::ostream &os, Generation gen);

// Every call the rest of the library makes into the switchtec-user C library goes through here. The
// signalling conventions are the C library's own: a null device from Open() or a negative return marks
// a failure, and the reason is only available from LastError() until the next failing call.
//
// Implementations are not expected to be thread safe. Callers hold boundary_mutex() across each call and
// the LastError() read that follows it.
class Boundary
{
public:
	virtual ~Boundary() = default;

	virtual switchtec_dev *Open(const char *path) = 0;
	virtual void Close(switchtec_dev *dev) = 0;
	virtual const char *LastError() = 0;

	virtual const char *Name(switchtec_dev *dev) = 0;
	virtual int FirmwareVersion(switchtec_dev *dev, char *buf, std::size_t buflen) = 0;
	virtual BootPhase GetBootPhase(switchtec_dev *dev) = 0;
	virtual Generation GetGeneration(switchtec_dev *dev) = 0;
	virtual int Partition(switchtec_dev *dev) = 0;
	virtual float DieTemperature(switchtec_dev *dev) = 0;
};

// The boundary backed by the installed switchtec-user library.
Boundary &default_boundary();

// The last-error indicator is process wide, so one lock serialises all boundaries and all devices.
std::mutex &boundary_mutex();

} // namespace libswitchtecpp
