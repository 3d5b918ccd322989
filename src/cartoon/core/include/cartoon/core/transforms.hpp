#pragma once

#include "cartoon/core/pixelBuffer.hpp"

// The pixel transforms of the cartoon pipeline. Each one reads its inputs without modifying them and returns a new image of the same size.
// The OpenCL kernels of the accelerator backend implement the same arithmetic (see kernelSource.cpp) and must stay bit-identical to these.
namespace cartoon::core {

//! Smooth the image with the 5x5 Gaussian filter. Each channel is rounded (add 0.5, truncate) and clamped.
PixelBuffer gaussianBlur(const PixelBuffer& image);

/*! Detect edges with the Sobel filters.
 *  The gradient magnitude of a pixel is |Rv|+|Gv|+|Bv|+|Rh|+|Gh|+|Bh| over the vertical and horizontal filter responses.
 *  \param [in] edgeThreshold Non-zero magnitudes >= this are edges. Small values (e.g. 50) mark a lot of edges, large values (e.g. 1000) few.
 *                            With 0 every colour change is an edge, flat regions never are.
 *  \returns    Black pixels on edges, white pixels elsewhere.
 */
PixelBuffer sobelEdgeDetect(const PixelBuffer& image, int edgeThreshold);

/*! Convert one colour value (0..255) to one of numPerChannel evenly spaced levels.
 *  For numPerChannel == 3: 0..85 -> 0, 86..170 -> 127, 171..255 -> 255.
 *  Output levels always start at 0 and end at 255.
 *  \param [in] numPerChannel Number of output levels, 2..256.
 */
int quantizeColour(int colourValue, int numPerChannel);

//! Reduce every channel of every pixel to numPerChannel levels (see quantizeColour).
PixelBuffer reduceColours(const PixelBuffer& image, int numPerChannel);

/*! Merge a mask on top of another image.
 *  \param [in] mask       Mask image.
 *  \param [in] maskColour Exact pixel value. Where the mask has this value, the photo shows through.
 *  \param [in] photo      Underlying image. Must have the same size as the mask.
 *  \throws     std::invalid_argument on a size mismatch.
 */
PixelBuffer mergeMask(const PixelBuffer& mask, Pixel maskColour, const PixelBuffer& photo);

//! Grey version of the image: (r+g+b)/3 in every channel.
PixelBuffer grayscale(const PixelBuffer& image);

} // namespace cartoon::core
