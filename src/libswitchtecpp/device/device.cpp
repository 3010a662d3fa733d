/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * device.cpp - Owning handle for an open switchtec device
 */

#include <mutex>
#include <optional>
#include <stdint.h>
#include <utility>
#include <vector>

#include "libswitchtecpp/common/error.hpp"
#include "libswitchtecpp/common/logging.hpp"

#include "device.hpp"
#include "last_error.hpp"
#include "marshal.hpp"

using namespace libswitchtecpp;

Device Device::Open(const std::filesystem::path &path, Boundary &boundary)
{
	const std::string &native = path.native();
	if (native.find('\0') != std::string::npos)
		throw Error(ErrorKind::InvalidData, "Device path contains a null byte");

	// Copied up front so nothing can throw between a successful open and the Device taking ownership.
	std::filesystem::path owned_path = path;

	switchtec_dev *dev;
	std::optional<Error> failure;

	// Only the open and its error read are under the lock. The Device built below closes itself if
	// anything after it throws, and Close() takes the lock again.
	{
		std::scoped_lock<std::mutex> l(boundary_mutex());

		dev = boundary.Open(native.c_str());
		if (!dev)
			failure = translate_last_error(boundary, ErrorKind::NotFound);
	}

	if (failure)
	{
		SWITCHTECPP_LOG(warning, "Unable to open " << path << ": " << failure->what());
		throw *failure;
	}

	Device device(boundary, dev, std::move(owned_path));
	SWITCHTECPP_LOG(debug, "Opened " << device.Path());

	return device;
}

Device::Device(Boundary &boundary, switchtec_dev *dev, std::filesystem::path &&path)
	: boundary_(&boundary), dev_(dev), path_(std::move(path))
{
}

Device::~Device()
{
	Close();
}

Device::Device(Device &&other)
	: boundary_(other.boundary_), dev_(other.dev_), path_(std::move(other.path_))
{
	other.dev_ = nullptr;
}

Device &Device::operator=(Device &&other)
{
	if (this != &other)
	{
		Close();

		boundary_ = other.boundary_;
		dev_ = other.dev_;
		path_ = std::move(other.path_);
		other.dev_ = nullptr;
	}

	return *this;
}

void Device::Close()
{
	if (!Valid())
		return;

	{
		std::scoped_lock<std::mutex> l(boundary_mutex());
		boundary_->Close(dev_);
	}

	dev_ = nullptr;
	SWITCHTECPP_LOG(debug, "Closed " << path_);
}

switchtec_dev *Device::session() const
{
	if (!Valid())
		throw Error(ErrorKind::OperationFailed, "Device " + path_.string() + " is not open");

	return dev_;
}

std::string Device::Name() const
{
	switchtec_dev *dev = session();
	const char *name;

	{
		std::scoped_lock<std::mutex> l(boundary_mutex());
		name = boundary_->Name(dev);
	}

	// No name is not a failure.
	return string_from_ptr(name);
}

std::string Device::FirmwareVersion(std::size_t length) const
{
	if (!length)
		throw Error(ErrorKind::InvalidData, "Firmware version buffer length must be non-zero");

	switchtec_dev *dev = session();
	std::vector<uint8_t> buf(length, 0);
	std::optional<Error> failure;

	{
		std::scoped_lock<std::mutex> l(boundary_mutex());
		int ret = boundary_->FirmwareVersion(dev, reinterpret_cast<char *>(buf.data()), buf.size());
		if (ret < 0)
			failure = translate_last_error(*boundary_, ErrorKind::OperationFailed);
	}

	if (failure)
	{
		SWITCHTECPP_LOG(warning, "Firmware version read failed on " << path_ << ": " << failure->what());
		throw *failure;
	}

	return string_from_buffer(buf);
}

BootPhase Device::GetBootPhase() const
{
	switchtec_dev *dev = session();
	std::scoped_lock<std::mutex> l(boundary_mutex());
	return boundary_->GetBootPhase(dev);
}

Generation Device::GetGeneration() const
{
	switchtec_dev *dev = session();
	std::scoped_lock<std::mutex> l(boundary_mutex());
	return boundary_->GetGeneration(dev);
}

int Device::Partition() const
{
	switchtec_dev *dev = session();
	std::scoped_lock<std::mutex> l(boundary_mutex());
	return boundary_->Partition(dev);
}

float Device::DieTemperature() const
{
	switchtec_dev *dev = session();
	std::optional<Error> failure;
	float temp;

	{
		std::scoped_lock<std::mutex> l(boundary_mutex());
		temp = boundary_->DieTemperature(dev);
		if (temp < 0)
			failure = translate_last_error(*boundary_, ErrorKind::OperationFailed);
	}

	if (failure)
	{
		SWITCHTECPP_LOG(warning, "Die temperature read failed on " << path_ << ": " << failure->what());
		throw *failure;
	}

	return temp;
}

DeviceSummary Device::Summary() const
{
	DeviceSummary summary;

	summary.name = Name();
	summary.firmware_version = FirmwareVersion();
	summary.boot_phase = GetBootPhase();
	summary.generation = GetGeneration();
	summary.partition = Partition();

	return summary;
}

std::ostream &libswitchtecpp::operator<<(std::ostream &os, const Device &device)
{
	return os << "Device(path=" << device.Path() << ", " << (device.Valid() ? "open" : "closed") << ")";
}
