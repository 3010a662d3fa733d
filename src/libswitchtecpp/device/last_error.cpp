/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * last_error.cpp - Translation of the switchtec last-error indicator
 */

#include <cstring>
#include <optional>
#include <string>

#include "libswitchtecpp/common/logging.hpp"

#include "last_error.hpp"
#include "marshal.hpp"

namespace libswitchtecpp
{

const char *const UnknownErrorMessage = "Unknown error";

Error translate_last_error(Boundary &boundary, ErrorKind kind)
{
	const char *msg = boundary.LastError();
	if (!msg)
	{
		SWITCHTECPP_LOG(warning, "No error message available");
		return Error(ErrorKind::Unknown, UnknownErrorMessage);
	}

	std::optional<std::string> text = decode_text(msg, msg + std::strlen(msg));
	if (!text)
	{
		SWITCHTECPP_LOG(warning, "Error message is not valid UTF-8");
		return Error(ErrorKind::Unknown, UnknownErrorMessage);
	}

	return Error(kind, *text);
}

} // namespace libswitchtecpp
