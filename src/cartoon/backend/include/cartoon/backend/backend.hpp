#pragma once

#include "cartoon/core/config.hpp"
#include "cartoon/core/imageStack.hpp"
#include "cartoon/core/stageRecorder.hpp"

#include <memory>
#include <string_view>

namespace cartoon::backend {

//! Execution strategy for the cartoon pipeline.
enum class BackendKind { Reference, Accelerator };

/*! Runs the cartoon pipeline on the current top of an image stack.
 *  Both backends push the final cartoon image onto the stack. Apart from timing, callers cannot tell which one produced it.
 *
 *  Stack layout after run() (bottom to top) for the reference backend, and for the accelerator backend in debug mode:
 *    original, blurred, edges, original, quantized, cartoon
 *  Without debug output the accelerator backend only pushes the cartoon image.
 */
class Backend {
public:
	virtual ~Backend() = default;

	//! \param [in,out] stack    Must hold exactly the original photo.
	//! \param [in]     config   Pipeline settings.
	//! \param [in,out] recorder Optional stage timing collection.
	//! \returns        The cartoon image (new top of the stack).
	virtual const core::PixelBuffer& run(core::ImageStack& stack, const core::CartoonConfig& config, core::StageRecorder* recorder = nullptr) = 0;

	virtual std::string_view name() const = 0;
};

//! Stack positions of the intermediate images in the full layout.
static constexpr int STACK_ORIGINAL  = 0;
static constexpr int STACK_BLURRED   = 1;
static constexpr int STACK_EDGES     = 2;
static constexpr int STACK_QUANTIZED = 4;

std::unique_ptr<Backend> makeBackend(BackendKind kind);

} // namespace cartoon::backend
