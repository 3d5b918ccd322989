#include "cartoon/pipeline/cartoonifier.hpp"
#include "cartoon/pipeline/photoIo.hpp"

#include "cartoon/backend/acceleratorBackend.hpp"
#include "cartoon/backend/referenceBackend.hpp"
#include "cartoon/core/errors.hpp"
#include "cartoon/core/transforms.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace cartoon::pipeline {
namespace gtest {

//! Fresh directory for the files of the running test.
static std::filesystem::path workDirectory() {
	const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
	const std::filesystem::path dir =
	        std::filesystem::temp_directory_path() / "cartoonify_gtest" / (std::string(info->test_suite_name()) + "_" + info->name());
	std::filesystem::remove_all(dir);
	std::filesystem::create_directories(dir);
	return dir;
}

//! Photo with a sharp diagonal between a dark and a light half.
static core::PixelBuffer diagonalPhoto(const unsigned size) {
	core::PixelBuffer photo(size, size, core::createPixel(20, 40, 60));
	for (unsigned y = 0; y < size; ++y) {
		for (unsigned x = y; x < size; ++x) {
			photo.set(x, y, core::createPixel(230, 210, 190));
		}
	}
	return photo;
}

TEST(Cartoonifier, OutputNames) {
	const auto names = outputNames("holiday.JPG");
	ASSERT_TRUE(names.has_value());
	EXPECT_EQ(names->cartoon, "holiday_cartoon.jpg");
	EXPECT_EQ(names->blurred, "holiday_blurred.jpg");
	EXPECT_EQ(names->edges, "holiday_edges.jpg");
	EXPECT_EQ(names->colours, "holiday_colours.jpg");

	EXPECT_EQ(outputNames("my.trip.png")->cartoon, "my.trip_cartoon.png");
	EXPECT_EQ(outputNames("photos.d/beach.png")->cartoon, "photos.d/beach_cartoon.png");
}

TEST(Cartoonifier, NamesWithoutExtension) {
	EXPECT_FALSE(outputNames("README").has_value());
	EXPECT_FALSE(outputNames(".hidden").has_value());
	EXPECT_FALSE(outputNames("photos.d/beach").has_value());
	EXPECT_FALSE(outputNames("photos/.hidden").has_value());
}

TEST(Cartoonifier, SkipsUnknownFiles) {
	Cartoonifier cartoonifier;
	EXPECT_FALSE(cartoonifier.processPhoto("README").has_value());
	EXPECT_TRUE(cartoonifier.stack().empty());
}

TEST(Cartoonifier, ProcessPhoto) {
	const std::filesystem::path dir = workDirectory();
	const std::filesystem::path input = dir / "diagonal.png";
	encodePhoto(diagonalPhoto(12), input);

	Cartoonifier cartoonifier;
	const auto elapsed = cartoonifier.processPhoto(input.string());
	ASSERT_TRUE(elapsed.has_value());
	EXPECT_GE(*elapsed, 0.0);
	EXPECT_TRUE(cartoonifier.stack().empty());

	const std::filesystem::path output = dir / "diagonal_cartoon.png";
	ASSERT_TRUE(std::filesystem::exists(output));
	EXPECT_FALSE(std::filesystem::exists(dir / "diagonal_edges.png"));

	core::ImageStack expected;
	expected.push(diagonalPhoto(12));
	EXPECT_EQ(decodePhoto(output), backend::ReferenceBackend{}.run(expected, core::CartoonConfig{}));
}

TEST(Cartoonifier, DebugSavesIntermediates) {
	const std::filesystem::path dir = workDirectory();
	const std::filesystem::path input = dir / "diagonal.png";
	encodePhoto(diagonalPhoto(9), input);

	core::CartoonConfig config;
	config.debug = true;
	Cartoonifier cartoonifier(config);
	ASSERT_TRUE(cartoonifier.processPhoto(input.string()).has_value());

	for (const char* suffix: {"_cartoon.png", "_blurred.png", "_edges.png", "_colours.png"}) {
		EXPECT_TRUE(std::filesystem::exists(dir / (std::string("diagonal") + suffix))) << suffix;
	}
	EXPECT_EQ(decodePhoto(dir / "diagonal_blurred.png"), core::gaussianBlur(diagonalPhoto(9)));
	EXPECT_EQ(decodePhoto(dir / "diagonal_colours.png"), core::reduceColours(diagonalPhoto(9), config.numColours));
}

TEST(Cartoonifier, MissingPhotoLeavesEmptyStack) {
	const std::filesystem::path dir = workDirectory();

	Cartoonifier cartoonifier;
	EXPECT_THROW(cartoonifier.processPhoto((dir / "missing.png").string()), core::PhotoError);
	EXPECT_TRUE(cartoonifier.stack().empty());
	EXPECT_FALSE(std::filesystem::exists(dir / "missing_cartoon.png"));
}

TEST(Cartoonifier, AcceleratorFailureIsReported) {
	if (backend::AcceleratorBackend::deviceAvailable()) {
		GTEST_SKIP() << "OpenCL device present";
	}

	const std::filesystem::path dir = workDirectory();
	const std::filesystem::path input = dir / "diagonal.png";
	encodePhoto(diagonalPhoto(8), input);

	core::CartoonConfig config;
	config.useAccelerator = true;
	Cartoonifier cartoonifier(config);
	EXPECT_THROW(cartoonifier.processPhoto(input.string()), core::AcceleratorError);

	// No cartoon from a reference rerun either.
	EXPECT_TRUE(cartoonifier.stack().empty());
	EXPECT_FALSE(std::filesystem::exists(dir / "diagonal_cartoon.png"));
}

TEST(Cartoonifier, LoadPhotoSizeMismatch) {
	const std::filesystem::path dir = workDirectory();
	encodePhoto(diagonalPhoto(4), dir / "small.png");
	encodePhoto(diagonalPhoto(5), dir / "large.png");

	Cartoonifier cartoonifier;
	cartoonifier.loadPhoto(dir / "small.png");
	EXPECT_THROW(cartoonifier.loadPhoto(dir / "large.png"), core::PhotoError);
	EXPECT_EQ(cartoonifier.stack().size(), 1u);

	cartoonifier.loadPhoto(dir / "small.png");
	EXPECT_EQ(cartoonifier.stack().size(), 2u);
}

TEST(Cartoonifier, ProcessLoadedPhotoAndSave) {
	const std::filesystem::path dir = workDirectory();
	encodePhoto(diagonalPhoto(6), dir / "in.png");

	Cartoonifier cartoonifier;
	cartoonifier.loadPhoto(dir / "in.png");
	cartoonifier.processLoadedPhoto();
	ASSERT_EQ(cartoonifier.stack().size(), 6u);

	cartoonifier.savePhoto(dir / "edges.png", backend::STACK_EDGES);
	EXPECT_EQ(decodePhoto(dir / "edges.png"), cartoonifier.stack().at(backend::STACK_EDGES));
}

TEST(Cartoonifier, SwitchesBackend) {
	Cartoonifier cartoonifier;
	EXPECT_EQ(cartoonifier.backend().name(), "reference");

	core::CartoonConfig config;
	config.useAccelerator = true;
	cartoonifier.setConfig(config);
	EXPECT_EQ(cartoonifier.backend().name(), "opencl");
	EXPECT_TRUE(cartoonifier.config().useAccelerator);
}

} // namespace gtest
} // namespace cartoon::pipeline
