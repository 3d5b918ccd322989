#include "cartoon/core/convolution.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace cartoon::core {

namespace {

static int squareSide(const std::size_t count) {
	const auto side = static_cast<int>(std::lround(std::sqrt(static_cast<double>(count))));
	if (count == 0u || static_cast<std::size_t>(side) * static_cast<std::size_t>(side) != count) {
		throw std::invalid_argument("ConvolutionKernel: non-square filter with " + std::to_string(count) + " weights");
	}
	if (side % 2 == 0) {
		throw std::invalid_argument("ConvolutionKernel: filter side must be odd, not " + std::to_string(side));
	}
	return side;
}

} // namespace

// clang-format off
const ConvolutionKernel GAUSSIAN_FILTER{
	2,  4,  5,  4, 2, // sum=17
	4,  9, 12,  9, 4, // sum=38
	5, 12, 15, 12, 5, // sum=49
	4,  9, 12,  9, 4, // sum=38
	2,  4,  5,  4, 2, // sum=17
};

const ConvolutionKernel SOBEL_VERTICAL_FILTER{
	-1, 0, +1,
	-2, 0, +2,
	-1, 0, +1,
};

const ConvolutionKernel SOBEL_HORIZONTAL_FILTER{
	+1, +2, +1,
	 0,  0,  0,
	-1, -2, -1,
};
// clang-format on

ConvolutionKernel::ConvolutionKernel(std::initializer_list<int> weights) : ConvolutionKernel(std::vector<int>(weights)) {
}

ConvolutionKernel::ConvolutionKernel(std::vector<int> weights) : m_weights{std::move(weights)} {
	m_size = squareSide(m_weights.size());
}

int ConvolutionKernel::sum() const {
	return std::accumulate(m_weights.begin(), m_weights.end(), 0);
}

int convolve(const PixelBuffer& image, const ConvolutionKernel& kernel, const int xCentre, const int yCentre, const int channel) {
	const int size   = kernel.size();
	const int half   = kernel.half();
	const int width  = static_cast<int>(image.width());
	const int height = static_cast<int>(image.height());
	const int shift  = channel * COLOUR_BITS;

	int sum = 0;
	for (int ky = 0; ky < size; ++ky) {
		const int y = clampBorder(yCentre + ky - half, height);
		for (int kx = 0; kx < size; ++kx) {
			const int x     = clampBorder(xCentre + kx - half, width);
			const Pixel rgb = image.at(static_cast<unsigned>(x), static_cast<unsigned>(y));
			sum += static_cast<int>((rgb >> shift) & COLOUR_MASK) * kernel.weight(ky, kx);
		}
	}
	return sum;
}

} // namespace cartoon::core
