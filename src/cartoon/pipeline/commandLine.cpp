#include "cartoon/pipeline/commandLine.hpp"

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cartoon::pipeline {

namespace {

static int parseInt(std::string_view flag, const char* value) {
	std::size_t used = 0;
	int result       = 0;
	try {
		result = std::stoi(value, &used);
	} catch (const std::logic_error&) {
		throw std::invalid_argument(std::string(flag) + " expects an integer, not '" + value + "'");
	}
	if (value[used] != '\0') {
		throw std::invalid_argument(std::string(flag) + " expects an integer, not '" + value + "'");
	}
	return result;
}

} // namespace

CommandLine parseCommandLine(const int argc, const char* const* argv) {
	CommandLine result;

	int arg = 1;
	const auto needValue = [&](std::string_view flag) -> const char* {
		if (arg + 1 >= argc) {
			throw std::invalid_argument("Missing value after " + std::string(flag));
		}
		return argv[++arg];
	};

	for (; arg < argc; ++arg) {
		const std::string_view a = argv[arg];
		if (a == "-g") {
			result.config.useAccelerator = true;
		} else if (a == "-d") {
			result.config.debug = true;
		} else if (a == "-e") {
			result.config.setEdgeThreshold(parseInt(a, needValue(a)));
			result.edgeThresholdSet = true;
		} else if (a == "-c") {
			result.config.setNumColours(parseInt(a, needValue(a)));
			result.numColoursSet = true;
		} else {
			break;
		}
	}

	for (; arg < argc; ++arg) {
		result.photos.emplace_back(argv[arg]);
	}
	return result;
}

void printHelp(std::ostream& out) {
	out << "Arguments: [-g] [-d] [-e EdgeThreshold] [-c NumColours] photo1.jpg photo2.jpg ...\n"
	       "  -g use the GPU (OpenCL), to speed up photo processing.\n"
	       "  -d means turn on debugging, which saves intermediate photos and prints stage timings.\n"
	       "  -e EdgeThreshold values can range from 0 (every colour change is an edge) up to about 1000 or more.\n"
	       "  -c NumColours is the number of discrete values within each colour channel (2..256).\n";
}

} // namespace cartoon::pipeline
