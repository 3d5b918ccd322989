#pragma once

#include "cartoon/backend/backend.hpp"
#include "cartoon/core/config.hpp"
#include "cartoon/core/imageStack.hpp"
#include "cartoon/core/stageRecorder.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace cartoon::pipeline {

//! Files written for one input photo. "dir/name.ext" -> "dir/name_cartoon.ext" etc.
struct OutputNames {
	std::string cartoon; //!< Final image.
	std::string blurred; //!< Debug only.
	std::string edges;   //!< Debug only.
	std::string colours; //!< Debug only.
};

//! Output file names for an input photo. The extension is lower-cased.
//! \returns std::nullopt if the file name has no extension (no '.' after its first character).
std::optional<OutputNames> outputNames(const std::string& name);

/*! Turns photos into cartoons, one photo at a time.
 *  Process per photo: load onto an empty image stack, run the configured backend, save the top of the stack, clear the stack.
 *  The stack is empty between photos, so every photo may have a different size.
 */
class Cartoonifier {
public:
	explicit Cartoonifier(core::CartoonConfig config = core::CartoonConfig{});

	const core::CartoonConfig& config() const {
		return m_config;
	}
	void setConfig(core::CartoonConfig config); //!< Re-selects the backend if useAccelerator changed.

	/*! Load a photo and push it onto the image stack.
	 *  On an empty stack this sets the image size, otherwise the photo must match the size of the images on the stack.
	 *  \throws core::PhotoError if the photo cannot be read or has the wrong size.
	 */
	void loadPhoto(const std::filesystem::path& path);

	//! Save the image at the given stack position (default: top). Does not change the stack.
	//! \throws core::PhotoError if writing fails.
	void savePhoto(const std::filesystem::path& path, int position = -1) const;

	/*! Process one photo: "foo.jpg" is written to "foo_cartoon.jpg".
	 *  In debug mode also writes foo_blurred.jpg, foo_edges.jpg, foo_colours.jpg and prints the stage timings.
	 *  \returns Milliseconds spent in the backend (excludes loading and saving), or std::nullopt if the file was skipped for lacking an extension.
	 *  \throws  core::PhotoError, core::AcceleratorError. The image stack is empty afterwards in any case.
	 */
	std::optional<double> processPhoto(const std::string& name);

	//! Run the backend on the loaded photo.
	void processLoadedPhoto();

	const core::ImageStack& stack() const {
		return m_stack;
	}
	const backend::Backend& backend() const {
		return *m_backend;
	}

private:
	core::CartoonConfig m_config;
	core::ImageStack m_stack{};
	core::StageRecorder m_recorder{};
	std::unique_ptr<backend::Backend> m_backend;
};

} // namespace cartoon::pipeline
