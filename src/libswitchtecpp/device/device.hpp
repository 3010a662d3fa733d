/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * device.hpp - Owning handle for an open switchtec device
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>

#include "boundary.hpp"
#include "summary.hpp"

namespace libswitchtecpp
{

// A Device owns exactly one session opened with the switchtec library and closes it exactly once, either
// through Close() or when the Device is destroyed. Ownership can be moved but never shared.
//
// A Device must not be used from more than one thread at a time. All calls into the library are
// serialised on boundary_mutex(), which is shared with every other Device in the process.
class Device
{
public:
	static constexpr std::size_t FirmwareVersionLength = 64;

	// Throws Error with ErrorKind::InvalidData if the path holds a null byte (the library is never
	// called), or with the kind reported by translate_last_error() if the open fails. The default boundary
	// is defined in the switchtecpp library; linking switchtecpp_core alone needs an explicit Boundary.
	static Device Open(const std::filesystem::path &path, Boundary &boundary = default_boundary());

	~Device();

	Device(Device &&other);
	Device &operator=(Device &&other);

	Device(const Device &) = delete;
	Device &operator=(const Device &) = delete;

	// The raw session, still owned by this Device. Null once closed or moved from.
	switchtec_dev *Get() const
	{
		return dev_;
	}

	bool Valid() const
	{
		return dev_ != nullptr;
	}

	const std::filesystem::path &Path() const
	{
		return path_;
	}

	void Close();

	// Accessors each make one library call. They throw Error with ErrorKind::OperationFailed on a closed
	// Device.
	std::string Name() const;
	std::string FirmwareVersion(std::size_t length = FirmwareVersionLength) const;
	BootPhase GetBootPhase() const;
	Generation GetGeneration() const;
	int Partition() const;
	// Degrees Celsius.
	float DieTemperature() const;

	DeviceSummary Summary() const;

private:
	Device(Boundary &boundary, switchtec_dev *dev, std::filesystem::path &&path);

	switchtec_dev *session() const;

	Boundary *boundary_;
	switchtec_dev *dev_;
	std::filesystem::path path_;
};

std::ostream &operator<<(std::ostream &os, const Device &device);

} // namespace libswitchtecpp
