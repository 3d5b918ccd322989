#pragma once

#include "cartoon/backend/backend.hpp"

#include <string>
#include <string_view>

namespace cartoon::backend {

//! Progress of one accelerator run. Any failure after DeviceAcquired goes straight to Released.
enum class AcceleratorState { Uninitialized, DeviceAcquired, ProgramBuilt, BuffersAllocated, Dispatched, ReadBack, Released };

std::string_view toString(AcceleratorState state);

/*! Runs the pipeline as OpenCL kernels on the first GPU device, or the first CPU device if there is no GPU.
 *  Dependency graph of one run:
 *    queue 1: gaussianBlur -> sobelEdgeDetect ------> mergeMask -> readback
 *    queue 2: reduceColours -------------------------^
 *  Edge detection and colour reduction run concurrently. mergeMask waits on both completion events. The host blocks only at the readback.
 *
 *  Context, queues, program, kernels, buffers and events live for one run() call and are released on every exit path.
 *  Failures are thrown as core::AcceleratorError. There is no fallback to the reference backend.
 */
class AcceleratorBackend final : public Backend {
public:
	//! \throws core::AcceleratorError on any OpenCL failure. The stack is unchanged in that case.
	const core::PixelBuffer& run(core::ImageStack& stack, const core::CartoonConfig& config, core::StageRecorder* recorder = nullptr) override;

	std::string_view name() const override {
		return "opencl";
	}

	AcceleratorState state() const {
		return m_state;
	}

	//! Name of the device the last run used. Empty before the first run.
	const std::string& deviceName() const {
		return m_deviceName;
	}

	//! True if an OpenCL platform with a GPU or CPU device exists.
	static bool deviceAvailable();

private:
	AcceleratorState m_state{AcceleratorState::Uninitialized};
	std::string m_deviceName{};
};

} // namespace cartoon::backend
