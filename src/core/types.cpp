#include "nodus/core/types.hpp"

#include <chrono>

namespace nodus::core {
    Timestamp now_micros() noexcept {
        const auto d = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::microseconds>(d).count());
    }
} // namespace nodus::core
