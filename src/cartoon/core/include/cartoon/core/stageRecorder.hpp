#pragma once

#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>

namespace cartoon::core {

//! Duration of one pipeline stage.
struct StageTiming {
	std::string name;    //!< Stage name, e.g. "gaussian blur".
	double milliseconds; //!< Time the stage took.
};

//! Stopwatch for a single stage.
class StageTimer {
public:
	StageTimer() : m_start(std::chrono::steady_clock::now()) {
	}

	void reset() {
		m_start = std::chrono::steady_clock::now();
	}

	double ms() const {
		const std::chrono::duration<double, std::milli> diff = std::chrono::steady_clock::now() - m_start;
		return diff.count();
	}

private:
	std::chrono::steady_clock::time_point m_start;
};

//! Can be passed to the backends to collect per-stage timings for debugging purposes.
class StageRecorder {
public:
	void record(std::string name, double milliseconds); //!< Add the timing of a finished stage.
	void clear();

	const std::vector<StageTiming>& stages() const {
		return m_stages;
	}

	void print(std::ostream& out) const; //!< One line per stage: "  <name> took <secs> secs."

private:
	std::vector<StageTiming> m_stages{};
};

} // namespace cartoon::core
