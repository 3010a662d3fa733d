/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * marshal.cpp - Conversion of C strings and fixed buffers to owned text
 */

#include <cstring>

#include <boost/locale/encoding_utf.hpp>

#include "libswitchtecpp/common/error.hpp"

#include "marshal.hpp"

namespace libswitchtecpp
{

std::optional<std::string> decode_text(const char *begin, const char *end)
{
	namespace conv = boost::locale::conv;

	try
	{
		return conv::utf_to_utf<char>(begin, end, conv::stop);
	}
	catch (const conv::conversion_error &)
	{
		return std::nullopt;
	}
}

std::string string_from_ptr(const char *str)
{
	if (!str)
		return {};

	std::optional<std::string> text = decode_text(str, str + std::strlen(str));
	if (!text)
		throw Error(ErrorKind::InvalidData, "String is not valid UTF-8");

	return *text;
}

std::string string_from_buffer(const char *buf, std::size_t len)
{
	if (!len)
		return {};

	const char *end = static_cast<const char *>(std::memchr(buf, '\0', len));
	if (!end)
		end = buf + len;

	std::optional<std::string> text = decode_text(buf, end);
	if (!text)
		throw Error(ErrorKind::InvalidData, "Buffer does not hold valid UTF-8");

	return *text;
}

} // namespace libswitchtecpp
