#pragma once

#include "types.hpp"
#include <atomic>
#include <chrono>

namespace ferry
{
    /**
     * Time source for deadlines and pacing. Ledgers never read the system
     * clock directly so that operation deadlines and bridge-in cooldowns can be
     * driven deterministically.
     */
    class Clock
    {
    public:
        virtual ~Clock() = default;

        virtual Timestamp now() const = 0;
    };

    class SystemClock : public Clock
    {
    public:
        Timestamp now() const override
        {
            return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
        }
    };

    /** Manually advanced clock, used by tests and the in-process demo */
    class ManualClock : public Clock
    {
    public:
        explicit ManualClock(Timestamp start = Timestamp{std::chrono::seconds{1'700'000'000}})
            : now_(start.time_since_epoch().count()) {}

        Timestamp now() const override
        {
            return Timestamp{std::chrono::seconds{now_.load()}};
        }

        void advance(std::chrono::seconds delta)
        {
            now_ += delta.count();
        }

        void set(Timestamp ts)
        {
            now_ = ts.time_since_epoch().count();
        }

    private:
        std::atomic<std::int64_t> now_;
    };

} // namespace ferry
