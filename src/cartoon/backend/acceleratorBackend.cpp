#include "cartoon/backend/acceleratorBackend.hpp"
#include "kernelSource.hpp"

#include "cartoon/core/errors.hpp"

#define CL_HPP_ENABLE_EXCEPTIONS
#define CL_HPP_TARGET_OPENCL_VERSION 120
#define CL_HPP_MINIMUM_OPENCL_VERSION 120
#include <CL/opencl.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cartoon::backend {

namespace {

static_assert(sizeof(core::Pixel) == sizeof(cl_uint), "pixels are exchanged with the device as cl_uint");

//! Readable name of an OpenCL error code.
static std::string errorName(const cl_int code) {
	switch (code) {
	case CL_DEVICE_NOT_FOUND:
		return "CL_DEVICE_NOT_FOUND";
	case CL_DEVICE_NOT_AVAILABLE:
		return "CL_DEVICE_NOT_AVAILABLE";
	case CL_COMPILER_NOT_AVAILABLE:
		return "CL_COMPILER_NOT_AVAILABLE";
	case CL_MEM_OBJECT_ALLOCATION_FAILURE:
		return "CL_MEM_OBJECT_ALLOCATION_FAILURE";
	case CL_OUT_OF_RESOURCES:
		return "CL_OUT_OF_RESOURCES";
	case CL_OUT_OF_HOST_MEMORY:
		return "CL_OUT_OF_HOST_MEMORY";
	case CL_BUILD_PROGRAM_FAILURE:
		return "CL_BUILD_PROGRAM_FAILURE";
	case CL_INVALID_VALUE:
		return "CL_INVALID_VALUE";
	case CL_INVALID_DEVICE:
		return "CL_INVALID_DEVICE";
	case CL_INVALID_CONTEXT:
		return "CL_INVALID_CONTEXT";
	case CL_INVALID_COMMAND_QUEUE:
		return "CL_INVALID_COMMAND_QUEUE";
	case CL_INVALID_MEM_OBJECT:
		return "CL_INVALID_MEM_OBJECT";
	case CL_INVALID_BUFFER_SIZE:
		return "CL_INVALID_BUFFER_SIZE";
	case CL_INVALID_PROGRAM_EXECUTABLE:
		return "CL_INVALID_PROGRAM_EXECUTABLE";
	case CL_INVALID_KERNEL_NAME:
		return "CL_INVALID_KERNEL_NAME";
	case CL_INVALID_KERNEL_ARGS:
		return "CL_INVALID_KERNEL_ARGS";
	case CL_INVALID_WORK_DIMENSION:
		return "CL_INVALID_WORK_DIMENSION";
	case CL_INVALID_WORK_GROUP_SIZE:
		return "CL_INVALID_WORK_GROUP_SIZE";
	case CL_INVALID_GLOBAL_WORK_SIZE:
		return "CL_INVALID_GLOBAL_WORK_SIZE";
	case CL_INVALID_EVENT_WAIT_LIST:
		return "CL_INVALID_EVENT_WAIT_LIST";
	case CL_EXEC_STATUS_ERROR_FOR_EVENTS_IN_WAIT_LIST:
		return "CL_EXEC_STATUS_ERROR_FOR_EVENTS_IN_WAIT_LIST";
	case -1001:
		return "CL_PLATFORM_NOT_FOUND_KHR";
	default:
		return "OpenCL error " + std::to_string(code);
	}
}

static core::AcceleratorError toAcceleratorError(const cl::Error& error) {
	return core::AcceleratorError(std::string(error.what()) + " failed: " + errorName(error.err()), error.err());
}

//! Devices of one type. A platform without such devices is not an error.
static std::vector<cl::Device> devicesOfType(const cl::Platform& platform, const cl_device_type type) {
	std::vector<cl::Device> devices;
	try {
		platform.getDevices(type, &devices);
	} catch (const cl::Error& error) {
		if (error.err() != CL_DEVICE_NOT_FOUND) {
			throw;
		}
		devices.clear();
	}
	return devices;
}

//! First GPU device of the first platform, else its first CPU device.
static cl::Device selectDevice() {
	std::vector<cl::Platform> platforms;
	cl::Platform::get(&platforms);
	if (platforms.empty()) {
		throw core::AcceleratorError("no OpenCL platform found", -1001);
	}

	std::vector<cl::Device> devices = devicesOfType(platforms.front(), CL_DEVICE_TYPE_GPU);
	if (devices.empty()) {
		std::cout << "No GPU found, using CPU\n";
		devices = devicesOfType(platforms.front(), CL_DEVICE_TYPE_CPU);
	}
	if (devices.empty()) {
		throw core::AcceleratorError("no OpenCL GPU or CPU device found", CL_DEVICE_NOT_FOUND);
	}
	return devices.front();
}

//! One kernel dispatch in the dependency graph of a run.
struct DispatchTask {
	const char* name;                       //!< Stage name for timings.
	cl::Kernel& kernel;                     //!< Kernel with all arguments set.
	cl::CommandQueue& queue;                //!< Queue the kernel is enqueued on.
	std::vector<cl::Event> prerequisites{}; //!< Completion events this dispatch waits for.
	cl::Event done{};                       //!< Signalled when the kernel finished.
};

//! Enqueue the task over one work item per pixel.
static void dispatch(DispatchTask& task, const cl::NDRange& range) {
	const std::vector<cl::Event>* waitList = task.prerequisites.empty() ? nullptr : &task.prerequisites;
	task.queue.enqueueNDRangeKernel(task.kernel, cl::NullRange, range, cl::NullRange, waitList, &task.done);
}

//! Device execution time of a finished task. Queue must have been created with profiling enabled.
static double deviceMilliseconds(const DispatchTask& task) {
	const cl_ulong start = task.done.getProfilingInfo<CL_PROFILING_COMMAND_START>();
	const cl_ulong end   = task.done.getProfilingInfo<CL_PROFILING_COMMAND_END>();
	return static_cast<double>(end - start) / 1e6;
}

//! Host images produced by one run.
struct RunOutput {
	std::vector<core::Pixel> cartoon;
	std::vector<core::Pixel> blurred;   //!< Only read back with intermediates.
	std::vector<core::Pixel> edges;     //!< Only read back with intermediates.
	std::vector<core::Pixel> quantized; //!< Only read back with intermediates.
};

} // namespace

std::string_view toString(const AcceleratorState state) {
	switch (state) {
	case AcceleratorState::Uninitialized:
		return "Uninitialized";
	case AcceleratorState::DeviceAcquired:
		return "DeviceAcquired";
	case AcceleratorState::ProgramBuilt:
		return "ProgramBuilt";
	case AcceleratorState::BuffersAllocated:
		return "BuffersAllocated";
	case AcceleratorState::Dispatched:
		return "Dispatched";
	case AcceleratorState::ReadBack:
		return "ReadBack";
	case AcceleratorState::Released:
		return "Released";
	}
	return "Unknown";
}

bool AcceleratorBackend::deviceAvailable() {
	try {
		selectDevice();
		return true;
	} catch (const cl::Error& error) {
		std::cerr << "[Warning] OpenCL unavailable: " << toAcceleratorError(error).what() << '\n';
	} catch (const core::AcceleratorError& error) {
		std::cerr << "[Warning] OpenCL unavailable: " << error.what() << '\n';
	}
	return false;
}

const core::PixelBuffer& AcceleratorBackend::run(core::ImageStack& stack, const core::CartoonConfig& config, core::StageRecorder* recorder) {
	if (stack.size() != 1u) {
		throw std::invalid_argument("AcceleratorBackend: expected a stack holding only the original photo");
	}

	const core::PixelBuffer& original = stack.at(STACK_ORIGINAL);
	const unsigned width              = original.width();
	const unsigned height             = original.height();
	const std::size_t bytes           = original.size() * sizeof(cl_uint);
	const bool withIntermediates      = config.debug;

	m_state = AcceleratorState::Uninitialized;
	RunOutput output;

	// All OpenCL objects are scoped to this block. Their destructors release them on success and on every exception.
	const auto execute = [&]() {
		cl::Device device = selectDevice();
		m_deviceName      = device.getInfo<CL_DEVICE_NAME>();
		m_state           = AcceleratorState::DeviceAcquired;
		if (config.debug) {
			std::cout << "  using OpenCL device " << m_deviceName << '\n';
		}

		const cl_command_queue_properties properties = recorder ? CL_QUEUE_PROFILING_ENABLE : 0;
		cl::Context context(device);
		cl::CommandQueue queue1(context, device, properties);
		cl::CommandQueue queue2(context, device, properties);

		cl::Program program(context, std::string(KERNEL_SOURCE));
		program.build(std::vector<cl::Device>{device});
		cl::Kernel blurKernel(program, "gaussianBlur");
		cl::Kernel sobelKernel(program, "sobelEdgeDetect");
		cl::Kernel reduceKernel(program, "reduceColours");
		cl::Kernel mergeKernel(program, "mergeMask");
		m_state = AcceleratorState::ProgramBuilt;

		// The input is copied at creation, the device never writes to it.
		cl::Buffer input(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, bytes, const_cast<core::Pixel*>(original.data().data()));
		cl::Buffer blurred(context, CL_MEM_READ_WRITE, bytes);
		cl::Buffer edges(context, CL_MEM_READ_WRITE, bytes);
		cl::Buffer quantized(context, CL_MEM_READ_WRITE, bytes);
		cl::Buffer merged(context, CL_MEM_WRITE_ONLY, bytes);
		m_state = AcceleratorState::BuffersAllocated;

		const auto w = static_cast<cl_int>(width);
		const auto h = static_cast<cl_int>(height);

		blurKernel.setArg(0, input);
		blurKernel.setArg(1, blurred);
		blurKernel.setArg(2, w);
		blurKernel.setArg(3, h);

		sobelKernel.setArg(0, blurred);
		sobelKernel.setArg(1, edges);
		sobelKernel.setArg(2, w);
		sobelKernel.setArg(3, h);
		sobelKernel.setArg(4, static_cast<cl_int>(config.edgeThreshold));

		reduceKernel.setArg(0, input);
		reduceKernel.setArg(1, quantized);
		reduceKernel.setArg(2, w);
		reduceKernel.setArg(3, h);
		reduceKernel.setArg(4, static_cast<cl_int>(config.numColours));

		mergeKernel.setArg(0, edges);
		mergeKernel.setArg(1, quantized);
		mergeKernel.setArg(2, merged);
		mergeKernel.setArg(3, static_cast<cl_uint>(core::WHITE));
		mergeKernel.setArg(4, w);
		mergeKernel.setArg(5, h);

		const cl::NDRange range(width, height);

		DispatchTask blurTask{"gaussian blur", blurKernel, queue1};
		dispatch(blurTask, range);

		DispatchTask reduceTask{"colour reduction", reduceKernel, queue2};
		dispatch(reduceTask, range);
		queue2.flush(); // Submit now so the merge on queue 1 can wait for it.

		DispatchTask sobelTask{"sobel edge detect", sobelKernel, queue1, {blurTask.done}};
		dispatch(sobelTask, range);

		DispatchTask mergeTask{"masking edges", mergeKernel, queue1, {sobelTask.done, reduceTask.done}};
		dispatch(mergeTask, range);
		m_state = AcceleratorState::Dispatched;

		output.cartoon.resize(original.size());
		const std::vector<cl::Event> mergeDone{mergeTask.done};
		queue1.enqueueReadBuffer(merged, CL_TRUE, 0, bytes, output.cartoon.data(), &mergeDone);

		if (withIntermediates) {
			const auto readBack = [&](cl::Buffer& buffer, const DispatchTask& task, std::vector<core::Pixel>& target) {
				target.resize(original.size());
				const std::vector<cl::Event> done{task.done};
				queue1.enqueueReadBuffer(buffer, CL_TRUE, 0, bytes, target.data(), &done);
			};
			readBack(blurred, blurTask, output.blurred);
			readBack(edges, sobelTask, output.edges);
			readBack(quantized, reduceTask, output.quantized);
		}
		m_state = AcceleratorState::ReadBack;

		if (recorder) {
			for (const DispatchTask* task: {&blurTask, &sobelTask, &reduceTask, &mergeTask}) {
				recorder->record(task->name, deviceMilliseconds(*task));
			}
		}
	};

	try {
		execute();
	} catch (const cl::BuildError& error) {
		m_state = AcceleratorState::Released;
		std::string message = "OpenCL program build failed: " + errorName(error.err());
		for (const auto& [device, log]: error.getBuildLog()) {
			message += "\n" + log;
		}
		throw core::AcceleratorError(message, error.err());
	} catch (const cl::Error& error) {
		m_state = AcceleratorState::Released;
		throw toAcceleratorError(error);
	} catch (const core::AcceleratorError&) {
		m_state = AcceleratorState::Released;
		throw;
	} catch (...) {
		// Host side failures (e.g. std::bad_alloc on readback) propagate unchanged.
		m_state = AcceleratorState::Released;
		throw;
	}
	m_state = AcceleratorState::Released;

	if (withIntermediates) {
		stack.push(core::PixelBuffer(width, height, std::move(output.blurred)));
		stack.push(core::PixelBuffer(width, height, std::move(output.edges)));
		stack.duplicate(STACK_ORIGINAL);
		stack.push(core::PixelBuffer(width, height, std::move(output.quantized)));
	}
	stack.push(core::PixelBuffer(width, height, std::move(output.cartoon)));
	return stack.top();
}

} // namespace cartoon::backend
