#include "cartoon/core/imageStack.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace cartoon::core {

void ImageStack::push(PixelBuffer image) {
	if (m_images.empty()) {
		m_width  = image.width();
		m_height = image.height();
	} else if (image.width() != m_width || image.height() != m_height) {
		throw std::invalid_argument("ImageStack: pushed " + std::to_string(image.width()) + "x" + std::to_string(image.height()) +
		                            " image onto a stack of " + std::to_string(m_width) + "x" + std::to_string(m_height) + " images");
	}
	m_images.push_back(std::move(image));
}

PixelBuffer ImageStack::pop() {
	if (m_images.empty()) {
		throw std::out_of_range("ImageStack: pop on an empty stack");
	}
	PixelBuffer result = std::move(m_images.back());
	m_images.pop_back();
	return result;
}

void ImageStack::duplicate(const int position) {
	PixelBuffer copy = m_images[resolve(position)];
	m_images.push_back(std::move(copy));
}

const PixelBuffer& ImageStack::at(const int position) const {
	return m_images[resolve(position)];
}

const PixelBuffer& ImageStack::top() const {
	return at(-1);
}

void ImageStack::clear() {
	m_images.clear();
	m_width  = 0u;
	m_height = 0u;
}

std::size_t ImageStack::resolve(const int position) const {
	const auto count = static_cast<long long>(m_images.size());
	const long long index = position >= 0 ? position : count + position;
	if (index < 0 || index >= count) {
		throw std::out_of_range("ImageStack: position " + std::to_string(position) + " outside stack of size " + std::to_string(count));
	}
	return static_cast<std::size_t>(index);
}

} // namespace cartoon::core
