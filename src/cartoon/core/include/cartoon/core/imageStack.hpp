#pragma once

#include "cartoon/core/pixelBuffer.hpp"

#include <vector>

namespace cartoon::core {

/*! Processing history of one photo.
 *  The original photo sits at the bottom (position 0) and the current image on top (position -1).
 *  Transforms never modify an entry destructively; they push a new image instead.
 *  All images share the width/height of the first image pushed after construction or clear().
 *
 *  Positions: >= 0 counts from the bottom, < 0 counts from the top (-1 is the top).
 *  Valid positions are [-size(), size() - 1]. Misuse throws std::out_of_range.
 */
class ImageStack {
public:
	//! Push an image. Becomes the new top.
	//! \throws std::invalid_argument if the size differs from the images already on the stack.
	void push(PixelBuffer image);

	//! Remove the top image and return it.
	//! \throws std::out_of_range on an empty stack.
	PixelBuffer pop();

	//! Push a copy of the image at the given position.
	void duplicate(int position);

	const PixelBuffer& at(int position) const; //!< Image at a stack position.
	const PixelBuffer& top() const;            //!< Current image. Same as at(-1).

	void clear(); //!< Empty the stack and forget the established image size.

	std::size_t size() const {
		return m_images.size();
	}
	bool empty() const {
		return m_images.empty();
	}

	unsigned width() const {
		return m_width;
	}
	unsigned height() const {
		return m_height;
	}

private:
	std::size_t resolve(int position) const; //!< Map a stack position to an index in m_images.

private:
	std::vector<PixelBuffer> m_images{};
	unsigned m_width{0u};  //!< Width of all images. Set by the first push.
	unsigned m_height{0u}; //!< Height of all images. Set by the first push.
};

} // namespace cartoon::core
