#pragma once

#include "cartoon/core/config.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace cartoon::pipeline {

//! Parsed arguments of the cartoonify tool: [-g] [-d] [-e EdgeThreshold] [-c NumColours] photo1.jpg photo2.jpg ...
struct CommandLine {
	core::CartoonConfig config{};
	bool edgeThresholdSet{false}; //!< -e was given.
	bool numColoursSet{false};    //!< -c was given.
	std::vector<std::string> photos{};
};

//! Flags may appear in any order before the first photo. Everything from the first non-flag argument on is a photo path.
//! \throws std::invalid_argument for a missing or invalid flag value.
CommandLine parseCommandLine(int argc, const char* const* argv);

void printHelp(std::ostream& out);

} // namespace cartoon::pipeline
