/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * last_error.hpp - Translation of the switchtec last-error indicator
 */
#pragma once

#include "libswitchtecpp/common/error.hpp"

#include "boundary.hpp"

namespace libswitchtecpp
{

// Message used when the indicator is null or does not decode.
extern const char *const UnknownErrorMessage;

// Must be called straight after the failing boundary call, with boundary_mutex() still held, as the next
// failure overwrites the indicator. Never throws a decoding error itself: an unreadable indicator gives an
// ErrorKind::Unknown result.
Error translate_last_error(Boundary &boundary, ErrorKind kind);

} // namespace libswitchtecpp
