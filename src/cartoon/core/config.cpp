#include "cartoon/core/config.hpp"

#include <stdexcept>
#include <string>

namespace cartoon::core {

void CartoonConfig::setEdgeThreshold(const int threshold) {
	if (threshold < 0) {
		throw std::invalid_argument("edge threshold must be at least zero, not " + std::to_string(threshold));
	}
	edgeThreshold = threshold;
}

void CartoonConfig::setNumColours(const int colours) {
	// One colour per channel would need a division by zero when spreading the output levels.
	if (colours < MIN_NUM_COLOURS || colours > MAX_NUM_COLOURS) {
		throw std::invalid_argument("number of colours must be " + std::to_string(MIN_NUM_COLOURS) + ".." + std::to_string(MAX_NUM_COLOURS) + ", not " +
		                            std::to_string(colours));
	}
	numColours = colours;
}

} // namespace cartoon::core
