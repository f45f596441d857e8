#pragma once

#include <chrono>

namespace lb {

using Secs = std::chrono::seconds;

/**
 * Steady clock with time shifting.
 * Time shifting is not thread-safe and MUST ONLY be used for testing in controlled environments.
 */
class SteadyClock : public std::chrono::steady_clock {
public:
    using Base = std::chrono::steady_clock;

    /**
     * Return the base clock time plus the accumulated time shift. Hides now() from base class.
     * @return the shifted time
     */
    static time_point now() noexcept {
        return Base::now() + m_time_shift;
    }

    /**
     * WARNING: not thread-safe, intended only for testing
     */
    static void add_time_shift(duration value) {
        m_time_shift += value;
    }

    /**
     * WARNING: not thread-safe, intended only for testing
     */
    static void reset_time_shift() {
        m_time_shift = duration::zero();
    }

private:
    static duration m_time_shift;
};

} // namespace lb
