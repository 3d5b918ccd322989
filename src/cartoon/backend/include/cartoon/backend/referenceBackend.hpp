#pragma once

#include "cartoon/backend/backend.hpp"

namespace cartoon::backend {

//! Runs every transform sequentially on the host. Each stage reads the top of the stack and pushes its result.
class ReferenceBackend final : public Backend {
public:
	const core::PixelBuffer& run(core::ImageStack& stack, const core::CartoonConfig& config, core::StageRecorder* recorder = nullptr) override;

	std::string_view name() const override {
		return "reference";
	}
};

//! Single pipeline steps on the stack. Each pushes one new image.
void gaussianBlur(core::ImageStack& stack);
void sobelEdgeDetect(core::ImageStack& stack, int edgeThreshold);
void reduceColours(core::ImageStack& stack, int numColours);
void grayscale(core::ImageStack& stack);

//! Merge the image at maskPosition on top of the image at photoPosition (positions as in ImageStack::duplicate).
void mergeMask(core::ImageStack& stack, int maskPosition, core::Pixel maskColour, int photoPosition);

} // namespace cartoon::backend
