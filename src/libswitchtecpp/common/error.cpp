/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * error.cpp - libswitchtecpp error reporting
 */

#include "error.hpp"

namespace libswitchtecpp
{

const char *error_kind_name(ErrorKind kind)
{
	switch (kind)
	{
	case ErrorKind::NotFound:
		return "NotFound";
	case ErrorKind::InvalidData:
		return "InvalidData";
	case ErrorKind::OperationFailed:
		return "OperationFailed";
	case ErrorKind::Unknown:
		break;
	}

	return "Unknown";
}

std::ostream &operator<<(std::ostream &os, ErrorKind kind)
{
	return os << error_kind_name(kind);
}

} // namespace libswitchtecpp
