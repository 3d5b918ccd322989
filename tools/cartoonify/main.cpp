#include "cartoon/core/errors.hpp"
#include "cartoon/pipeline/cartoonifier.hpp"
#include "cartoon/pipeline/commandLine.hpp"

#include <format>
#include <iostream>
#include <stdexcept>

// Processes lots of photos and uses edge detection and colour reduction to make them cartoon-like.
// Each input image, e.g. xyz.jpg, is written to xyz_cartoon.jpg. Run without arguments for the usage message.
int main(int argc, char** argv) {
	using namespace cartoon;

	if (argc < 2) {
		pipeline::printHelp(std::cout);
		return 1;
	}

	pipeline::CommandLine commandLine;
	try {
		commandLine = pipeline::parseCommandLine(argc, argv);
	} catch (const std::invalid_argument& e) {
		std::cerr << "[Error] " << e.what() << '\n';
		pipeline::printHelp(std::cout);
		return 1;
	}

	if (commandLine.photos.empty()) {
		pipeline::printHelp(std::cout);
		return 1;
	}
	if (commandLine.edgeThresholdSet) {
		std::cout << "Using edge threshold " << commandLine.config.edgeThreshold << '\n';
	}
	if (commandLine.numColoursSet) {
		std::cout << "Using " << commandLine.config.numColours << " discrete colours per channel.\n";
	}

	pipeline::Cartoonifier cartoonifier(commandLine.config);

	double totalMs  = 0.0;
	unsigned done   = 0u;
	unsigned failed = 0u;
	for (const auto& photo: commandLine.photos) {
		try {
			if (const auto elapsedMs = cartoonifier.processPhoto(photo)) {
				totalMs += *elapsedMs;
				++done;
			}
		} catch (const core::PhotoError& e) {
			std::cerr << "[Error] " << e.what() << '\n';
			++failed;
		} catch (const core::AcceleratorError& e) {
			std::cerr << "[Error] OpenCL processing of " << photo << " failed: " << e.what() << '\n';
			++failed;
		} catch (const std::exception& e) {
			std::cerr << "[Error] Processing of " << photo << " failed: " << e.what() << '\n';
			++failed;
		}
	}

	const double averageSecs = done > 0u ? totalMs / done / 1e3 : 0.0;
	std::cout << std::format("Average processing time is {:.3f} for {} photos.\n", averageSecs, done);

	return (failed > 0u && done == 0u) ? 1 : 0;
}
