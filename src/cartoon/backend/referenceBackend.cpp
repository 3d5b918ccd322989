#include "cartoon/backend/referenceBackend.hpp"

#include "cartoon/core/transforms.hpp"

#include <stdexcept>
#include <utility>

namespace cartoon::backend {

void gaussianBlur(core::ImageStack& stack) {
	stack.push(core::gaussianBlur(stack.top()));
}

void sobelEdgeDetect(core::ImageStack& stack, const int edgeThreshold) {
	stack.push(core::sobelEdgeDetect(stack.top(), edgeThreshold));
}

void reduceColours(core::ImageStack& stack, const int numColours) {
	stack.push(core::reduceColours(stack.top(), numColours));
}

void grayscale(core::ImageStack& stack) {
	stack.push(core::grayscale(stack.top()));
}

void mergeMask(core::ImageStack& stack, const int maskPosition, const core::Pixel maskColour, const int photoPosition) {
	// Resolve both inputs before pushing: a push may reallocate the stack storage.
	core::PixelBuffer merged = core::mergeMask(stack.at(maskPosition), maskColour, stack.at(photoPosition));
	stack.push(std::move(merged));
}

const core::PixelBuffer& ReferenceBackend::run(core::ImageStack& stack, const core::CartoonConfig& config, core::StageRecorder* recorder) {
	if (stack.size() != 1u) {
		throw std::invalid_argument("ReferenceBackend: expected a stack holding only the original photo");
	}

	const auto timed = [recorder](const char* stageName, auto&& stage) {
		core::StageTimer timer;
		stage();
		if (recorder) {
			recorder->record(stageName, timer.ms());
		}
	};

	timed("gaussian blur", [&] { gaussianBlur(stack); });
	timed("sobel edge detect", [&] { sobelEdgeDetect(stack, config.edgeThreshold); });
	const int edgeMask = static_cast<int>(stack.size()) - 1;

	// Now convert the original image into a few discrete colours.
	stack.duplicate(STACK_ORIGINAL);
	timed("colour reduction", [&] { reduceColours(stack, config.numColours); });
	timed("masking edges", [&] { mergeMask(stack, edgeMask, core::WHITE, -1); });

	return stack.top();
}

} // namespace cartoon::backend
