#include "cartoon/pipeline/cartoonifier.hpp"
#include "cartoon/pipeline/photoIo.hpp"

#include "cartoon/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iostream>
#include <utility>

namespace cartoon::pipeline {

namespace {

static backend::BackendKind backendKind(const core::CartoonConfig& config) {
	return config.useAccelerator ? backend::BackendKind::Accelerator : backend::BackendKind::Reference;
}

} // namespace

std::optional<OutputNames> outputNames(const std::string& name) {
	// The extension must belong to the file name, not to a directory. A leading dot does not start an extension.
	const auto dot   = name.rfind('.');
	const auto slash = name.find_last_of("/\\");
	if (dot == std::string::npos || dot == 0u || (slash != std::string::npos && dot <= slash + 1u)) {
		return std::nullopt;
	}

	const std::string baseName = name.substr(0, dot);
	std::string extension      = name.substr(dot);
	std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	return OutputNames{
	        baseName + "_cartoon" + extension,
	        baseName + "_blurred" + extension,
	        baseName + "_edges" + extension,
	        baseName + "_colours" + extension,
	};
}

Cartoonifier::Cartoonifier(core::CartoonConfig config) : m_config{config}, m_backend{backend::makeBackend(backendKind(config))} {
}

void Cartoonifier::setConfig(core::CartoonConfig config) {
	const bool switchBackend = config.useAccelerator != m_config.useAccelerator;
	m_config                 = config;
	if (switchBackend) {
		m_backend = backend::makeBackend(backendKind(m_config));
	}
}

void Cartoonifier::loadPhoto(const std::filesystem::path& path) {
	core::PixelBuffer photo = decodePhoto(path);
	if (!m_stack.empty() && (photo.width() != m_stack.width() || photo.height() != m_stack.height())) {
		throw core::PhotoError(std::format("Incorrect image size: {} is {}x{}, expected {}x{}", path.string(), photo.width(), photo.height(), m_stack.width(),
		                                   m_stack.height()));
	}
	m_stack.push(std::move(photo));
}

void Cartoonifier::savePhoto(const std::filesystem::path& path, const int position) const {
	encodePhoto(m_stack.at(position), path);
}

void Cartoonifier::processLoadedPhoto() {
	m_backend->run(m_stack, m_config, m_config.debug ? &m_recorder : nullptr);
}

std::optional<double> Cartoonifier::processPhoto(const std::string& name) {
	const std::optional<OutputNames> names = outputNames(name);
	if (!names) {
		std::cerr << "Skipping unknown kind of file: " << name << '\n';
		return std::nullopt;
	}

	m_recorder.clear();
	double elapsedMs = 0.0;
	try {
		loadPhoto(name);

		const core::StageTimer timer;
		processLoadedPhoto();
		elapsedMs = timer.ms();

		std::cout << std::format("Done {} -> {} in {:.3f} secs.\n", name, names->cartoon, elapsedMs / 1e3);
		if (m_config.debug) {
			m_recorder.print(std::cout);
		}

		savePhoto(names->cartoon);
		if (m_config.debug) {
			savePhoto(names->colours, backend::STACK_QUANTIZED);
			savePhoto(names->edges, backend::STACK_EDGES);
			savePhoto(names->blurred, backend::STACK_BLURRED);
		}
	} catch (...) {
		// Leave an empty stack for the next photo, then report.
		m_stack.clear();
		throw;
	}

	m_stack.clear();
	return elapsedMs;
}

} // namespace cartoon::pipeline
