#include "cartoon/core/config.hpp"
#include "cartoon/core/stageRecorder.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

namespace cartoon::core {
namespace gtest {

TEST(Config, Defaults) {
	const CartoonConfig config;
	EXPECT_EQ(config.edgeThreshold, 128);
	EXPECT_EQ(config.numColours, 3);
	EXPECT_FALSE(config.useAccelerator);
	EXPECT_FALSE(config.debug);
}

TEST(Config, EdgeThreshold) {
	CartoonConfig config;
	config.setEdgeThreshold(0);
	EXPECT_EQ(config.edgeThreshold, 0);
	config.setEdgeThreshold(1000);
	EXPECT_EQ(config.edgeThreshold, 1000);

	EXPECT_THROW(config.setEdgeThreshold(-1), std::invalid_argument);
	EXPECT_EQ(config.edgeThreshold, 1000);
}

TEST(Config, NumColours) {
	CartoonConfig config;
	config.setNumColours(2);
	EXPECT_EQ(config.numColours, 2);
	config.setNumColours(256);
	EXPECT_EQ(config.numColours, 256);

	EXPECT_THROW(config.setNumColours(1), std::invalid_argument);
	EXPECT_THROW(config.setNumColours(0), std::invalid_argument);
	EXPECT_THROW(config.setNumColours(257), std::invalid_argument);
	EXPECT_EQ(config.numColours, 256);
}

TEST(StageRecorder, PrintsSeconds) {
	StageRecorder recorder;
	recorder.record("gaussian blur", 1500.0);
	recorder.record("sobel edge detect", 2.0);
	ASSERT_EQ(recorder.stages().size(), 2u);
	EXPECT_EQ(recorder.stages()[0].name, "gaussian blur");

	std::ostringstream out;
	recorder.print(out);
	EXPECT_EQ(out.str(), "  gaussian blur took 1.500 secs.\n  sobel edge detect took 0.002 secs.\n");

	recorder.clear();
	EXPECT_TRUE(recorder.stages().empty());
}

TEST(StageRecorder, TimerIsMonotonic) {
	StageTimer timer;
	const double first = timer.ms();
	EXPECT_GE(first, 0.0);
	EXPECT_GE(timer.ms(), first);
}

} // namespace gtest
} // namespace cartoon::core
