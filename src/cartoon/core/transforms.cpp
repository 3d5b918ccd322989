#include "cartoon/core/transforms.hpp"
#include "cartoon/core/convolution.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace cartoon::core {

namespace {

//! Offset subtracted before rounding to the nearest bucket. Slightly below 0.5 so exact bucket boundaries round down on every backend.
static constexpr float BUCKET_ROUNDING = 0.49999f;

} // namespace

PixelBuffer gaussianBlur(const PixelBuffer& image) {
	PixelBuffer result(image.width(), image.height());
	const int width  = static_cast<int>(image.width());
	const int height = static_cast<int>(image.height());

	for (int y = 0; y < height; ++y) {
		for (int x = 0; x < width; ++x) {
			const int r = clampColour(static_cast<float>(convolve(image, GAUSSIAN_FILTER, x, y, RED)) / GAUSSIAN_SUM);
			const int g = clampColour(static_cast<float>(convolve(image, GAUSSIAN_FILTER, x, y, GREEN)) / GAUSSIAN_SUM);
			const int b = clampColour(static_cast<float>(convolve(image, GAUSSIAN_FILTER, x, y, BLUE)) / GAUSSIAN_SUM);
			result.set(static_cast<unsigned>(x), static_cast<unsigned>(y), createPixel(r, g, b));
		}
	}
	return result;
}

PixelBuffer sobelEdgeDetect(const PixelBuffer& image, const int edgeThreshold) {
	PixelBuffer result(image.width(), image.height());
	const int width  = static_cast<int>(image.width());
	const int height = static_cast<int>(image.height());

	for (int y = 0; y < height; ++y) {
		for (int x = 0; x < width; ++x) {
			const int redVertical     = convolve(image, SOBEL_VERTICAL_FILTER, x, y, RED);
			const int greenVertical   = convolve(image, SOBEL_VERTICAL_FILTER, x, y, GREEN);
			const int blueVertical    = convolve(image, SOBEL_VERTICAL_FILTER, x, y, BLUE);
			const int redHorizontal   = convolve(image, SOBEL_HORIZONTAL_FILTER, x, y, RED);
			const int greenHorizontal = convolve(image, SOBEL_HORIZONTAL_FILTER, x, y, GREEN);
			const int blueHorizontal  = convolve(image, SOBEL_HORIZONTAL_FILTER, x, y, BLUE);

			// Plain sum instead of sqrt(v^2 + h^2). Catches most edges and stays in integers.
			const int verticalGradient   = std::abs(redVertical) + std::abs(greenVertical) + std::abs(blueVertical);
			const int horizontalGradient = std::abs(redHorizontal) + std::abs(greenHorizontal) + std::abs(blueHorizontal);

			// A flat region (zero gradient) is never an edge, even with threshold 0.
			const int totalGradient = verticalGradient + horizontalGradient;
			const bool isEdge       = totalGradient > 0 && totalGradient >= edgeThreshold;
			result.set(static_cast<unsigned>(x), static_cast<unsigned>(y), isEdge ? BLACK : WHITE);
		}
	}
	return result;
}

int quantizeColour(const int colourValue, const int numPerChannel) {
	const float colour = static_cast<float>(colourValue) / (COLOUR_MASK + 1.0f) * static_cast<float>(numPerChannel);
	const int discrete = std::clamp(static_cast<int>(std::round(colour - BUCKET_ROUNDING)), 0, numPerChannel - 1);
	return discrete * COLOUR_MASK / (numPerChannel - 1);
}

PixelBuffer reduceColours(const PixelBuffer& image, const int numPerChannel) {
	PixelBuffer result(image.width(), image.height());
	for (std::size_t i = 0; i < image.size(); ++i) {
		const Pixel rgb = image[i];
		result[i]       = createPixel(quantizeColour(red(rgb), numPerChannel), quantizeColour(green(rgb), numPerChannel),
		                              quantizeColour(blue(rgb), numPerChannel));
	}
	return result;
}

PixelBuffer mergeMask(const PixelBuffer& mask, const Pixel maskColour, const PixelBuffer& photo) {
	if (!mask.sameSize(photo)) {
		throw std::invalid_argument("mergeMask: mask and photo differ in size");
	}

	PixelBuffer result(mask.width(), mask.height());
	for (std::size_t i = 0; i < mask.size(); ++i) {
		result[i] = mask[i] == maskColour ? photo[i] : mask[i];
	}
	return result;
}

PixelBuffer grayscale(const PixelBuffer& image) {
	PixelBuffer result(image.width(), image.height());
	for (std::size_t i = 0; i < image.size(); ++i) {
		const Pixel rgb   = image[i];
		const int average = (red(rgb) + green(rgb) + blue(rgb)) / 3;
		result[i]         = createPixel(average, average, average);
	}
	return result;
}

} // namespace cartoon::core
