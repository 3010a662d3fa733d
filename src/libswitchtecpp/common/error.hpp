/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * error.hpp - libswitchtecpp error reporting
 */
#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace libswitchtecpp
{

enum class ErrorKind
{
	// The device could not be located or accessed when opening.
	NotFound,
	// Text that does not decode, or a path with an embedded null byte.
	InvalidData,
	// Any other failure reported by the switchtec library.
	OperationFailed,
	// The library's last-error indicator could not be read.
	Unknown
};

const char *error_kind_name(ErrorKind kind);

std::ostream &operator<<(std::ostream &os, ErrorKind kind);

class Error : public std::runtime_error
{
public:
	Error(ErrorKind kind, const std::string &message)
		: std::runtime_error(message), kind_(kind)
	{
	}

	ErrorKind Kind() const
	{
		return kind_;
	}

	std::string Message() const
	{
		return what();
	}

private:
	ErrorKind kind_;
};

} // namespace libswitchtecpp
