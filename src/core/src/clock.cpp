#include "core/clock.hpp"

namespace sk::core {

SteadyClock::SteadyClock() : origin_(std::chrono::steady_clock::now()) {}

double SteadyClock::now() const {
    using seconds_d = std::chrono::duration<double>;
    return std::chrono::duration_cast<seconds_d>(std::chrono::steady_clock::now() - origin_).count();
}

} // namespace sk::core
