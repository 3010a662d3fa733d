/* SPDX-License-Identifier: BSD-2-Clause */
/*
 * Copyright (C) 2025 Raspberry Pi Ltd
 *
 * switchtec_temp.cpp - libswitchtecpp die temperature example
 */

#include <iomanip>
#include <iostream>
#include <string>

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "libswitchtecpp/common/error.hpp"
#include "libswitchtecpp/common/logging.hpp"
#include "libswitchtecpp/common/version.hpp"
#include "libswitchtecpp/device/device.hpp"

int main(int argc, char *argv[])
{
	libswitchtecpp::logging_init();

	cxxopts::Options options(argv[0], "Switchtec die temperature reader");

	options.add_options()
		("device", "Switchtec device node", cxxopts::value<std::string>()->default_value("/dev/pciswitch0"))
		("s,summary", "Print the device name, firmware version, boot phase, generation and partition")
		("j,json", "Print the device summary as JSON")
		("v,version", "Print the library version")
		("h,help", "Print usage")
	;

	options.parse_positional({ "device" });
	options.positional_help("[device]");
	options.set_width(120);

	auto args = options.parse(argc, argv);

	if (args.count("help"))
	{
		std::cerr << options.help() << std::endl;
		exit(0);
	}
	else if (args.count("version"))
	{
		std::cout << libswitchtecpp::version() << std::endl;
		exit(0);
	}

	const std::string path = args["device"].as<std::string>();

	try
	{
		libswitchtecpp::Device dev = libswitchtecpp::Device::Open(path);

		if (args.count("json"))
			std::cout << nlohmann::json(dev.Summary()).dump(4) << std::endl;
		else if (args.count("summary"))
			std::cout << dev.Summary();
		else
			std::cout << "Temperature: " << std::fixed << std::setprecision(2) << dev.DieTemperature() << "C"
					  << std::endl;
	}
	catch (const libswitchtecpp::Error &e)
	{
		std::cerr << "Unable to read switchtec device at " << path << ": " << e.what() << " (" << e.Kind() << ")"
				  << std::endl;
		exit(-1);
	}

	return 0;
}
