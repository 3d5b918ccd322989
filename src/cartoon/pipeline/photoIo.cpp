#include "cartoon/pipeline/photoIo.hpp"

#include "cartoon/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <cstdint>
#include <string>

namespace cartoon::pipeline {

core::PixelBuffer toPixelBuffer(const cv::Mat& image) {
	if (image.empty()) {
		throw core::PhotoError("image is empty");
	}
	if (image.depth() != CV_8U) {
		throw core::PhotoError("expected an 8-bit image");
	}

	const int channels = image.channels();
	if (channels != 1 && channels != 3 && channels != 4) {
		throw core::PhotoError("unsupported number of channels: " + std::to_string(channels));
	}

	core::PixelBuffer buffer(static_cast<unsigned>(image.cols), static_cast<unsigned>(image.rows));
	for (int y = 0; y < image.rows; ++y) {
		const std::uint8_t* row = image.ptr<std::uint8_t>(y);
		for (int x = 0; x < image.cols; ++x) {
			const std::uint8_t* px = row + static_cast<std::ptrdiff_t>(x) * channels;
			// OpenCV stores B, G, R(, A). Gray has a single value for all three channels.
			const int b = px[0];
			const int g = channels == 1 ? px[0] : px[1];
			const int r = channels == 1 ? px[0] : px[2];
			buffer.set(static_cast<unsigned>(x), static_cast<unsigned>(y), core::createPixel(r, g, b));
		}
	}
	return buffer;
}

cv::Mat toMat(const core::PixelBuffer& buffer) {
	cv::Mat image(static_cast<int>(buffer.height()), static_cast<int>(buffer.width()), CV_8UC3);
	for (int y = 0; y < image.rows; ++y) {
		auto* row = image.ptr<cv::Vec3b>(y);
		for (int x = 0; x < image.cols; ++x) {
			const core::Pixel rgb = buffer.at(static_cast<unsigned>(x), static_cast<unsigned>(y));
			row[x] = cv::Vec3b(static_cast<uchar>(core::blue(rgb)), static_cast<uchar>(core::green(rgb)), static_cast<uchar>(core::red(rgb)));
		}
	}
	return image;
}

core::PixelBuffer decodePhoto(const std::filesystem::path& path) {
	// imread rejects some headers (e.g. more pixels than CV_IO_MAX_IMAGE_PIXELS) by throwing instead of returning an empty Mat.
	cv::Mat image;
	try {
		image = cv::imread(path.string(), cv::IMREAD_COLOR);
	} catch (const cv::Exception& e) {
		throw core::PhotoError("Invalid image file: " + path.string() + ": " + e.what());
	}
	if (image.empty()) {
		throw core::PhotoError("Invalid image file: " + path.string());
	}
	return toPixelBuffer(image);
}

void encodePhoto(const core::PixelBuffer& buffer, const std::filesystem::path& path) {
	bool written = false;
	try {
		written = cv::imwrite(path.string(), toMat(buffer));
	} catch (const cv::Exception& e) {
		throw core::PhotoError("Could not write " + path.string() + ": " + e.what());
	}
	if (!written) {
		throw core::PhotoError("Could not write " + path.string());
	}
}

} // namespace cartoon::pipeline
