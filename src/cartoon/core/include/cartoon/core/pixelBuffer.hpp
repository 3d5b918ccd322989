#pragma once

#include <cstdint>
#include <vector>

namespace cartoon::core {

using Pixel = std::uint32_t; //!< Packed RGB pixel: (0, red, green, blue), 8 bits each.

static constexpr int COLOUR_BITS = 8;                     //!< Bits per colour channel.
static constexpr int COLOUR_MASK = (1 << COLOUR_BITS) - 1; //!< Largest value of a channel (255).

//! Channel numbers as used by colourValue(). Blue is stored in the lowest byte.
enum Channel : int { BLUE = 0, GREEN = 1, RED = 2 };

//! Constructs one packed pixel from its components. Each component must be in [0, COLOUR_MASK].
Pixel createPixel(int red, int green, int blue);

//! Extract one colour channel (0..COLOUR_MASK) out of the given pixel.
inline int colourValue(Pixel pixel, int channel) {
	return static_cast<int>((pixel >> (channel * COLOUR_BITS)) & COLOUR_MASK);
}

inline int red(Pixel pixel) {
	return colourValue(pixel, RED);
}
inline int green(Pixel pixel) {
	return colourValue(pixel, GREEN);
}
inline int blue(Pixel pixel) {
	return colourValue(pixel, BLUE);
}

//! Round to nearest (add 0.5, truncate) and clamp a colour value into [0, COLOUR_MASK].
int clampColour(double value);

inline const Pixel BLACK = 0x000000u;
inline const Pixel WHITE = 0xFFFFFFu;

/*! Fixed-size rectangular grid of packed RGB pixels in row-major order.
 *  This is the unit of data passed between the pipeline stages.
 *  Invariant: data().size() == width() * height().
 */
class PixelBuffer {
public:
	PixelBuffer() = default;
	PixelBuffer(unsigned width, unsigned height, Pixel fill = BLACK);

	//! \throws std::invalid_argument if pixels.size() != width * height.
	PixelBuffer(unsigned width, unsigned height, std::vector<Pixel> pixels);

	unsigned width() const {
		return m_width;
	}
	unsigned height() const {
		return m_height;
	}
	std::size_t size() const {
		return m_data.size();
	}
	bool empty() const {
		return m_data.empty();
	}

	std::size_t index(unsigned x, unsigned y) const {
		return static_cast<std::size_t>(y) * m_width + x;
	}

	Pixel at(unsigned x, unsigned y) const {
		return m_data[index(x, y)];
	}
	void set(unsigned x, unsigned y, Pixel pixel) {
		m_data[index(x, y)] = pixel;
	}

	Pixel operator[](std::size_t i) const {
		return m_data[i];
	}
	Pixel& operator[](std::size_t i) {
		return m_data[i];
	}

	const std::vector<Pixel>& data() const {
		return m_data;
	}
	std::vector<Pixel>& data() {
		return m_data;
	}

	bool sameSize(const PixelBuffer& other) const {
		return m_width == other.m_width && m_height == other.m_height;
	}

	bool operator==(const PixelBuffer& other) const = default;

private:
	unsigned m_width{0u};
	unsigned m_height{0u};
	std::vector<Pixel> m_data{};
};

} // namespace cartoon::core
