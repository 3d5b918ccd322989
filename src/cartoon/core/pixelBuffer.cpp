#include "cartoon/core/pixelBuffer.hpp"

#include <cassert>
#include <stdexcept>
#include <string>
#include <utility>

namespace cartoon::core {

Pixel createPixel(const int red, const int green, const int blue) {
	assert(0 <= red && red <= COLOUR_MASK);
	assert(0 <= green && green <= COLOUR_MASK);
	assert(0 <= blue && blue <= COLOUR_MASK);
	return (static_cast<Pixel>(red) << (2 * COLOUR_BITS)) | (static_cast<Pixel>(green) << COLOUR_BITS) | static_cast<Pixel>(blue);
}

int clampColour(const double value) {
	const int result = static_cast<int>(value + 0.5);
	if (result <= 0) {
		return 0;
	}
	if (result > COLOUR_MASK) {
		return COLOUR_MASK;
	}
	return result;
}

PixelBuffer::PixelBuffer(const unsigned width, const unsigned height, const Pixel fill)
    : m_width{width}, m_height{height}, m_data(static_cast<std::size_t>(width) * height, fill) {
}

PixelBuffer::PixelBuffer(const unsigned width, const unsigned height, std::vector<Pixel> pixels)
    : m_width{width}, m_height{height}, m_data{std::move(pixels)} {
	if (m_data.size() != static_cast<std::size_t>(width) * height) {
		throw std::invalid_argument("PixelBuffer: expected " + std::to_string(static_cast<std::size_t>(width) * height) + " pixels, got " +
		                            std::to_string(m_data.size()));
	}
}

} // namespace cartoon::core
