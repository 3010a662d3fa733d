/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * logging.hpp - libswitchtecpp logging library
 */
#pragma once

#ifndef SWITCHTECPP_LOGGING_ENABLE
#define SWITCHTECPP_LOGGING_ENABLE 0
#endif

#if SWITCHTECPP_LOGGING_ENABLE

#include <boost/log/trivial.hpp>

#define SWITCHTECPP_LOG(sev, stuff) \
do { \
	if (SWITCHTECPP_LOGGING_ENABLE) \
		BOOST_LOG_TRIVIAL(sev) << __FUNCTION__ << ": " << stuff; \
} while (0)

#else

#define SWITCHTECPP_LOG(sev, stuff) do { } while(0)

#endif

namespace libswitchtecpp
{
	// Call this before you try and use any logging.
	void logging_init();
} // namespace libswitchtecpp
