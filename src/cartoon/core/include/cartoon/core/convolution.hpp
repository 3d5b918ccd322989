#pragma once

#include "cartoon/core/pixelBuffer.hpp"

#include <initializer_list>
#include <vector>

namespace cartoon::core {

//! Square matrix of integer weights, stored row-major. The side length is odd so the kernel has a centre cell.
class ConvolutionKernel {
public:
	//! \throws std::invalid_argument if the weights do not form an odd-sized square.
	ConvolutionKernel(std::initializer_list<int> weights);
	explicit ConvolutionKernel(std::vector<int> weights);

	int size() const {
		return m_size;
	}
	int half() const {
		return m_size >> 1;
	}
	int weight(int row, int col) const {
		return m_weights[static_cast<std::size_t>(row * m_size + col)];
	}
	int sum() const; //!< Sum of all weights.

	const std::vector<int>& weights() const {
		return m_weights;
	}

private:
	std::vector<int> m_weights;
	int m_size{0};
};

//! 5x5 Gaussian smoothing filter. Weights sum to GAUSSIAN_SUM.
extern const ConvolutionKernel GAUSSIAN_FILTER;
static constexpr float GAUSSIAN_SUM = 159.0f;

//! Sobel gradient filters. Weights sum to zero, results are used as magnitudes only.
extern const ConvolutionKernel SOBEL_VERTICAL_FILTER;
extern const ConvolutionKernel SOBEL_HORIZONTAL_FILTER;

/*! Map a coordinate that may be slightly outside the image back into [0, size-1].
 *  Clamps to the nearest edge pixel.
 *  \note The original photo tool documented a reflect-at-edge rule here but always executed clamping. Clamping is what both backends implement.
 */
inline int clampBorder(int pos, int size) {
	return pos < 0 ? 0 : (pos > size - 1 ? size - 1 : pos);
}

/*! Apply the kernel around (xCentre, yCentre) to one colour channel.
 *  Multiplies each pixel in the kernel window (border-clamped) by its weight and sums up. No normalisation.
 *  \param [in] channel One of RED, GREEN, BLUE.
 */
int convolve(const PixelBuffer& image, const ConvolutionKernel& kernel, int xCentre, int yCentre, int channel);

} // namespace cartoon::core
