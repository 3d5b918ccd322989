#pragma once

namespace cartoon::core {

//! Settings of the cartoon pipeline. Setters validate and throw std::invalid_argument, values are never clamped silently.
struct CartoonConfig {
	static constexpr int DEFAULT_EDGE_THRESHOLD = 128;
	static constexpr int DEFAULT_NUM_COLOURS    = 3;
	static constexpr int MIN_NUM_COLOURS        = 2;
	static constexpr int MAX_NUM_COLOURS        = 256;

	//! Level of colour change that counts as an edge.
	//! Small numbers (e.g. 50) give lots of heavy black edges, large numbers (e.g. 1000) fewer, thinner edges.
	int edgeThreshold{DEFAULT_EDGE_THRESHOLD};
	int numColours{DEFAULT_NUM_COLOURS}; //!< Values per colour channel after quantization.
	bool useAccelerator{false};          //!< Run the OpenCL backend instead of the reference backend.
	bool debug{false};                   //!< Print stage timings and save intermediate images.

	void setEdgeThreshold(int threshold); //!< \throws std::invalid_argument if threshold < 0.
	void setNumColours(int colours);      //!< \throws std::invalid_argument unless colours in [2, 256].
};

} // namespace cartoon::core
