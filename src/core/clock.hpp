#pragma once

#include "core/types.hpp"
#include <atomic>

namespace gbce {

/// Source of "now" for trade timestamps and window cutoffs
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
};

/// Wall clock
class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override;

    /// Process-wide instance, for components built without an explicit clock
    [[nodiscard]] static const SystemClock& instance();
};

/// Clock that only moves when told to; may be set backwards
/// Safe to read from one thread while another advances it
class ManualClock final : public Clock {
public:
    ManualClock();
    explicit ManualClock(Timestamp start);

    [[nodiscard]] Timestamp now() const override;

    void set_time(Timestamp t);

    void advance(Timestamp::duration delta);

private:
    std::atomic<Timestamp::rep> ticks_;
};

}  // namespace gbce
