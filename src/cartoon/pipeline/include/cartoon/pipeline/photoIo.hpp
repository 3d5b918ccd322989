#pragma once

#include "cartoon/core/pixelBuffer.hpp"

#include <opencv2/core/mat.hpp>

#include <filesystem>

namespace cartoon::pipeline {

//! Pack an 8-bit BGR, BGRA or grayscale image into a PixelBuffer. Alpha is dropped.
//! \throws core::PhotoError for empty images or other pixel formats.
core::PixelBuffer toPixelBuffer(const cv::Mat& image);

//! Unpack into an 8-bit 3-channel BGR image.
cv::Mat toMat(const core::PixelBuffer& buffer);

//! Read a photo in any format OpenCV can decode.
//! \throws core::PhotoError if the file cannot be read or decoded.
core::PixelBuffer decodePhoto(const std::filesystem::path& path);

//! Write a photo. The file extension selects the format (e.g. ".jpg", ".png").
//! \throws core::PhotoError if encoding or writing fails.
void encodePhoto(const core::PixelBuffer& buffer, const std::filesystem::path& path);

} // namespace cartoon::pipeline
