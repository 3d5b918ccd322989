#include "cartoon/backend/backend.hpp"
#include "cartoon/backend/acceleratorBackend.hpp"
#include "cartoon/backend/referenceBackend.hpp"

namespace cartoon::backend {

std::unique_ptr<Backend> makeBackend(const BackendKind kind) {
	switch (kind) {
	case BackendKind::Reference:
		return std::make_unique<ReferenceBackend>();
	case BackendKind::Accelerator:
		return std::make_unique<AcceleratorBackend>();
	}
	return std::make_unique<ReferenceBackend>();
}

} // namespace cartoon::backend
