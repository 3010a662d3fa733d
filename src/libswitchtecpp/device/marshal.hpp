/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * marshal.hpp - Conversion of C strings and fixed buffers to owned text
 */
#pragma once

#include <cstddef>
#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

namespace libswitchtecpp
{

// Returns a copy of [begin, end) if it is valid UTF-8, otherwise nothing.
std::optional<std::string> decode_text(const char *begin, const char *end);

// A null pointer means "no value" and gives an empty string. Bytes that are not valid UTF-8 throw an
// InvalidData Error.
std::string string_from_ptr(const char *str);

// Text stops at the first null byte; a buffer with no null byte is text in its entirety. The text must be
// valid UTF-8 or an InvalidData Error is thrown.
std::string string_from_buffer(const char *buf, std::size_t len);

inline std::string string_from_buffer(const std::vector<uint8_t> &buf)
{
	return string_from_buffer(reinterpret_cast<const char *>(buf.data()), buf.size());
}

} // namespace libswitchtecpp
