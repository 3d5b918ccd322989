#pragma once

#include <stdexcept>
#include <string>

namespace cartoon::core {

//! A photo could not be read or written, or does not match the size of the images being processed.
class PhotoError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! The OpenCL device, program build, dispatch or readback failed. Carries the OpenCL diagnostic.
class AcceleratorError : public std::runtime_error {
public:
	explicit AcceleratorError(const std::string& message, int code = 0) : std::runtime_error(message), m_code{code} {
	}

	int code() const {
		return m_code;
	}

private:
	int m_code; //!< OpenCL error code (CL_SUCCESS == 0 if not applicable).
};

} // namespace cartoon::core
