#include "kernelSource.hpp"

namespace cartoon::backend {

const char* const KERNEL_SOURCE = R"CLC(
// Results must match the host transforms bit for bit: no fused multiply-add.
#pragma OPENCL FP_CONTRACT OFF

#define COLOUR_BITS 8
#define COLOUR_MASK 0xFF
#define RED 2
#define GREEN 1
#define BLUE 0

#define GAUSSIAN_SUM 159.0f
#define BUCKET_ROUNDING 0.49999f

__constant int GAUSSIAN_FILTER[25] = {
	2,  4,  5,  4, 2,
	4,  9, 12,  9, 4,
	5, 12, 15, 12, 5,
	4,  9, 12,  9, 4,
	2,  4,  5,  4, 2,
};

__constant int SOBEL_VERTICAL_FILTER[9] = {
	-1, 0, +1,
	-2, 0, +2,
	-1, 0, +1,
};

__constant int SOBEL_HORIZONTAL_FILTER[9] = {
	+1, +2, +1,
	 0,  0,  0,
	-1, -2, -1,
};

inline int clampBorder(int pos, int size) {
	return max(0, min(pos, size - 1));
}

inline int colourValue(uint pixel, int channel) {
	return (int)((pixel >> (channel * COLOUR_BITS)) & COLOUR_MASK);
}

inline uint createPixel(int red, int green, int blue) {
	return ((uint)red << (2 * COLOUR_BITS)) | ((uint)green << COLOUR_BITS) | (uint)blue;
}

inline int clampColour(float value) {
	return clamp((int)(value + 0.5f), 0, COLOUR_MASK);
}

int convolve(__global const uint* image, int width, int height, int xCentre, int yCentre,
             __constant const int* filter, int filterSize, int channel) {
	const int half = filterSize >> 1;
	int sum = 0;
	for (int ky = 0; ky < filterSize; ++ky) {
		const int rowOffset = clampBorder(yCentre + ky - half, height) * width;
		for (int kx = 0; kx < filterSize; ++kx) {
			const int x = clampBorder(xCentre + kx - half, width);
			sum += colourValue(image[rowOffset + x], channel) * filter[ky * filterSize + kx];
		}
	}
	return sum;
}

inline int quantizeColour(int colourValue, int numPerChannel) {
	const float colour = (float)colourValue / (COLOUR_MASK + 1.0f) * (float)numPerChannel;
	const int discrete = clamp((int)round(colour - BUCKET_ROUNDING), 0, numPerChannel - 1);
	return discrete * COLOUR_MASK / (numPerChannel - 1);
}

__kernel void gaussianBlur(__global const uint* input, __global uint* output, int width, int height) {
	const int x = get_global_id(0);
	const int y = get_global_id(1);
	if (x >= width || y >= height) {
		return;
	}

	const int red   = clampColour((float)convolve(input, width, height, x, y, GAUSSIAN_FILTER, 5, RED) / GAUSSIAN_SUM);
	const int green = clampColour((float)convolve(input, width, height, x, y, GAUSSIAN_FILTER, 5, GREEN) / GAUSSIAN_SUM);
	const int blue  = clampColour((float)convolve(input, width, height, x, y, GAUSSIAN_FILTER, 5, BLUE) / GAUSSIAN_SUM);
	output[y * width + x] = createPixel(red, green, blue);
}

__kernel void sobelEdgeDetect(__global const uint* input, __global uint* output, int width, int height, int edgeThreshold) {
	const int x = get_global_id(0);
	const int y = get_global_id(1);
	if (x >= width || y >= height) {
		return;
	}

	const int verticalGradient = abs(convolve(input, width, height, x, y, SOBEL_VERTICAL_FILTER, 3, RED))
	                           + abs(convolve(input, width, height, x, y, SOBEL_VERTICAL_FILTER, 3, GREEN))
	                           + abs(convolve(input, width, height, x, y, SOBEL_VERTICAL_FILTER, 3, BLUE));
	const int horizontalGradient = abs(convolve(input, width, height, x, y, SOBEL_HORIZONTAL_FILTER, 3, RED))
	                             + abs(convolve(input, width, height, x, y, SOBEL_HORIZONTAL_FILTER, 3, GREEN))
	                             + abs(convolve(input, width, height, x, y, SOBEL_HORIZONTAL_FILTER, 3, BLUE));

	const int totalGradient = verticalGradient + horizontalGradient;
	const bool isEdge = totalGradient > 0 && totalGradient >= edgeThreshold;
	output[y * width + x] = isEdge ? createPixel(0, 0, 0) : createPixel(COLOUR_MASK, COLOUR_MASK, COLOUR_MASK);
}

__kernel void reduceColours(__global const uint* input, __global uint* output, int width, int height, int numColours) {
	const int x = get_global_id(0);
	const int y = get_global_id(1);
	if (x >= width || y >= height) {
		return;
	}

	const uint rgb = input[y * width + x];
	output[y * width + x] = createPixel(quantizeColour(colourValue(rgb, RED), numColours),
	                                    quantizeColour(colourValue(rgb, GREEN), numColours),
	                                    quantizeColour(colourValue(rgb, BLUE), numColours));
}

__kernel void mergeMask(__global const uint* mask, __global const uint* photo, __global uint* output, uint maskColour, int width, int height) {
	const int x = get_global_id(0);
	const int y = get_global_id(1);
	if (x >= width || y >= height) {
		return;
	}

	const int index = y * width + x;
	output[index] = mask[index] == maskColour ? photo[index] : mask[index];
}
)CLC";

} // namespace cartoon::backend
