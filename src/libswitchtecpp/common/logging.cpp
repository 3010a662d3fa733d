/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * logging.cpp - libswitchtecpp logging library
 */

#include <cstdlib>
#include <mutex>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace trivial = boost::log::trivial;

#include "logging.hpp"

namespace libswitchtecpp
{

namespace {

std::mutex mutex;

boost::shared_ptr<sinks::synchronous_sink<sinks::text_ostream_backend>> console;
boost::shared_ptr<sinks::synchronous_sink<sinks::text_file_backend>> file;

logging::formatter make_formatter()
{
	return expr::format("[libswitchtecpp %1%] %2%")
		% expr::attr<trivial::severity_level>("Severity")
		% expr::smessage;
}

unsigned int level_from_env(const char *name, unsigned int fallback)
{
	const char *lev = std::getenv(name);
	if (!lev)
		return fallback;

	char *end;
	unsigned long level = std::strtoul(lev, &end, 10);
	if (end == lev || level > static_cast<unsigned long>(trivial::fatal))
		return fallback;

	return level;
}

void logging_file_init(const char *filename, unsigned int level)
{
	file = logging::add_file_log(
			keywords::file_name = filename,
			keywords::rotation_size = 1 * 1024 * 1024,
			keywords::open_mode = std::ios_base::trunc,
			keywords::filter = trivial::severity >= level);
	file->set_formatter(make_formatter());
	file->locked_backend()->auto_flush(true);
}

} // namespace

void logging_init()
{
	std::scoped_lock<std::mutex> l(mutex);

	// Can only initialise the console logging once.
	if (console)
		return;

	logging::add_common_attributes();

	// Default to "warning" level.
	unsigned int level = level_from_env("SWITCHTECPP_LOG_LEVEL", trivial::warning);

	console = logging::add_console_log(std::clog);
	console->set_formatter(make_formatter());
	console->set_filter(trivial::severity >= level);

	const char *log_file = std::getenv("SWITCHTECPP_LOG_FILE");
	if (log_file)
		logging_file_init(log_file, level_from_env("SWITCHTECPP_LOG_FILE_LEVEL", level));
}

} // namespace libswitchtecpp
