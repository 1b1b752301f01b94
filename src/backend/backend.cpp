#include "backend/backend.hpp"
#include "backend/cpu_backend.hpp"
#include <stdexcept>

namespace zkshard {

std::unique_ptr<ProvingBackend> ProvingBackend::create(BackendType type, int num_threads) {
    switch (type) {
        case BackendType::CPU:
            return std::make_unique<CpuBackend>(num_threads);
        default:
            throw std::runtime_error("Unknown backend type");
    }
}

} // namespace zkshard
