#include "cartoon/core/stageRecorder.hpp"

#include <format>
#include <ostream>
#include <utility>

namespace cartoon::core {

void StageRecorder::record(std::string name, const double milliseconds) {
	m_stages.push_back(StageTiming{std::move(name), milliseconds});
}

void StageRecorder::clear() {
	m_stages.clear();
}

void StageRecorder::print(std::ostream& out) const {
	for (const auto& stage: m_stages) {
		out << std::format("  {} took {:.3f} secs.\n", stage.name, stage.milliseconds / 1e3);
	}
}

} // namespace cartoon::core
