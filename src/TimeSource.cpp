#include "drumsync/TimeSource.hpp"

#include <chrono>

namespace drumsync {

double SteadyTimeSource::now() const {
    using Clock = std::chrono::steady_clock;
    return std::chrono::duration<double>(Clock::now().time_since_epoch()).count();
}

TimeSourcePtr SteadyTimeSource::shared() {
    static TimeSourcePtr instance = std::make_shared<SteadyTimeSource>();
    return instance;
}

} // namespace drumsync
