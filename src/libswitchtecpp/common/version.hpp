/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * version.hpp - libswitchtecpp auto-generated versioning
 */
#pragma once

#include <string>

namespace libswitchtecpp {

const std::string& version();

} // namespace libswitchtecpp
