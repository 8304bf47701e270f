#pragma once

#include <atomic>
#include <memory>

namespace drumsync {

/**
 * Monotonic time source, in seconds.
 *
 * Every component reads "now" through one of these so that tests can
 * inject time (ManualTimeSource) and get deterministic results.
 */
class TimeSource {
public:
    virtual ~TimeSource() = default;

    [[nodiscard]] virtual double now() const = 0;
};

using TimeSourcePtr = std::shared_ptr<TimeSource>;

/**
 * std::chrono::steady_clock based source used in production.
 */
class SteadyTimeSource final : public TimeSource {
public:
    [[nodiscard]] double now() const override;

    /**
     * Shared process-wide instance.
     */
    static TimeSourcePtr shared();
};

/**
 * Time source that only moves when told to.
 */
class ManualTimeSource final : public TimeSource {
public:
    explicit ManualTimeSource(double start = 0.0)
        : now_(start)
    {
    }

    [[nodiscard]] double now() const override { return now_.load(); }

    void set(double seconds) { now_.store(seconds); }
    void advance(double seconds) { now_.store(now_.load() + seconds); }

private:
    std::atomic<double> now_;
};

} // namespace drumsync
