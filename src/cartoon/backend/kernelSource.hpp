#pragma once

namespace cartoon::backend {

//! OpenCL C source of the cartoon pipeline kernels: gaussianBlur, sobelEdgeDetect, reduceColours, mergeMask.
//! Same arithmetic as cartoon/core/transforms.hpp, one work item per pixel over a 2D (width, height) range.
extern const char* const KERNEL_SOURCE;

} // namespace cartoon::backend
