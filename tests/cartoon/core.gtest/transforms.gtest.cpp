#include "cartoon/core/transforms.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace cartoon::core {
namespace gtest {

//! Image with the left half black and the right half white.
static PixelBuffer verticalStep(const unsigned width, const unsigned height) {
	PixelBuffer image(width, height, BLACK);
	for (unsigned y = 0; y < height; ++y) {
		for (unsigned x = width / 2; x < width; ++x) {
			image.set(x, y, WHITE);
		}
	}
	return image;
}

TEST(Quantize, EndpointsArePreserved) {
	for (int k = 2; k <= 256; ++k) {
		EXPECT_EQ(quantizeColour(0, k), 0) << "k=" << k;
		EXPECT_EQ(quantizeColour(255, k), 255) << "k=" << k;
	}
}

TEST(Quantize, ThreeLevels) {
	for (int v = 0; v <= 255; ++v) {
		const int expected = v <= 85 ? 0 : (v <= 170 ? 127 : 255);
		EXPECT_EQ(quantizeColour(v, 3), expected) << "v=" << v;
	}
}

TEST(Quantize, TwoLevels) {
	EXPECT_EQ(quantizeColour(127, 2), 0);
	EXPECT_EQ(quantizeColour(128, 2), 255);
}

TEST(Quantize, FullRangeIsIdentity) {
	for (int v = 0; v <= 255; ++v) {
		EXPECT_EQ(quantizeColour(v, 256), v);
	}
}

TEST(Quantize, MonotonicAndBounded) {
	for (const int k: {2, 3, 4, 7, 16, 100, 256}) {
		int previous = 0;
		for (int v = 0; v <= 255; ++v) {
			const int level = quantizeColour(v, k);
			EXPECT_GE(level, previous) << "k=" << k << " v=" << v;
			EXPECT_LE(level, 255);
			previous = level;
		}
	}
}

TEST(Quantize, ReduceColoursPerChannel) {
	const PixelBuffer image(3, 1, {createPixel(10, 100, 200), createPixel(85, 86, 171), WHITE});
	const PixelBuffer reduced = reduceColours(image, 3);
	EXPECT_EQ(reduced.at(0, 0), createPixel(0, 127, 255));
	EXPECT_EQ(reduced.at(1, 0), createPixel(0, 127, 255));
	EXPECT_EQ(reduced.at(2, 0), WHITE);
	EXPECT_EQ(image.at(0, 0), createPixel(10, 100, 200));
}

TEST(Blur, UniformImageUnchanged) {
	const PixelBuffer image(7, 5, createPixel(10, 200, 77));
	EXPECT_EQ(gaussianBlur(image), image);
}

TEST(Blur, SinglePixelSpreads) {
	PixelBuffer image(5, 5, BLACK);
	image.set(2, 2, createPixel(255, 0, 0));
	const PixelBuffer blurred = gaussianBlur(image);

	// 255 * 15 / 159 = 24.06 and 255 * 2 / 159 = 3.21
	EXPECT_EQ(blurred.at(2, 2), createPixel(24, 0, 0));
	EXPECT_EQ(blurred.at(0, 0), createPixel(3, 0, 0));
	EXPECT_EQ(blurred.at(4, 4), createPixel(3, 0, 0));
}

TEST(Blur, CheckerboardWithRepeatedBorder) {
	const PixelBuffer image(2, 2, {BLACK, WHITE, WHITE, BLACK});
	const PixelBuffer blurred = gaussianBlur(image);
	EXPECT_EQ(blurred.at(0, 0), createPixel(115, 115, 115));
	EXPECT_EQ(blurred.at(1, 0), createPixel(140, 140, 140));
	EXPECT_EQ(blurred.at(0, 1), createPixel(140, 140, 140));
	EXPECT_EQ(blurred.at(1, 1), createPixel(115, 115, 115));
}

TEST(Edges, UniformImageIsWhite) {
	const PixelBuffer image(6, 4, createPixel(30, 60, 90));
	const PixelBuffer white(6, 4, WHITE);
	for (const int threshold: {0, 1, 128, 1000}) {
		EXPECT_EQ(sobelEdgeDetect(image, threshold), white) << "threshold=" << threshold;
	}
}

TEST(Edges, StepIsBlack) {
	const PixelBuffer edges = sobelEdgeDetect(verticalStep(6, 4), 128);
	for (unsigned y = 0; y < 4; ++y) {
		EXPECT_EQ(edges.at(0, y), WHITE);
		EXPECT_EQ(edges.at(1, y), WHITE);
		EXPECT_EQ(edges.at(2, y), BLACK);
		EXPECT_EQ(edges.at(3, y), BLACK);
		EXPECT_EQ(edges.at(4, y), WHITE);
		EXPECT_EQ(edges.at(5, y), WHITE);
	}
}

TEST(Edges, ThresholdAboveMagnitude) {
	// The step gives 3 * 4 * 255 = 3060 at the boundary.
	const PixelBuffer image = verticalStep(6, 4);
	EXPECT_EQ(sobelEdgeDetect(image, 3060).at(2, 0), BLACK);
	EXPECT_EQ(sobelEdgeDetect(image, 3061), PixelBuffer(6, 4, WHITE));
}

TEST(MergeMask, PhotoShowsThroughMaskColour) {
	const Pixel grey = createPixel(128, 128, 128);
	const PixelBuffer mask(2, 2, {WHITE, BLACK, grey, WHITE});
	const PixelBuffer photo(2, 2, {createPixel(1, 2, 3), createPixel(4, 5, 6), createPixel(7, 8, 9), createPixel(10, 11, 12)});
	const PixelBuffer maskCopy  = mask;
	const PixelBuffer photoCopy = photo;

	const PixelBuffer merged = mergeMask(mask, WHITE, photo);
	EXPECT_EQ(merged, PixelBuffer(2, 2, {createPixel(1, 2, 3), BLACK, grey, createPixel(10, 11, 12)}));
	EXPECT_EQ(mask, maskCopy);
	EXPECT_EQ(photo, photoCopy);
}

TEST(MergeMask, SizeMismatch) {
	EXPECT_THROW(mergeMask(PixelBuffer(2, 2), WHITE, PixelBuffer(3, 2)), std::invalid_argument);
}

TEST(Grayscale, AveragesChannels) {
	const PixelBuffer image(2, 1, {createPixel(10, 20, 33), WHITE});
	const PixelBuffer grey = grayscale(image);
	EXPECT_EQ(grey.at(0, 0), createPixel(21, 21, 21));
	EXPECT_EQ(grey.at(1, 0), WHITE);
}

} // namespace gtest
} // namespace cartoon::core
