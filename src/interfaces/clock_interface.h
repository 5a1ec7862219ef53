#ifndef MIMEID_CLOCK_INTERFACE_H
#define MIMEID_CLOCK_INTERFACE_H

#include <chrono>
#include <cstdint>

namespace mimeid {

/**
 * @brief Abstract wall-clock source
 *
 * Lets the token generator read time through an injectable seam so tests
 * can pin the timestamp component.
 */
class ClockInterface {
public:
    virtual ~ClockInterface() = default;

    /**
     * @brief Current time
     * @return milliseconds since the Unix epoch, never negative
     */
    virtual std::int64_t nowMillis() const = 0;
};

/**
 * @brief Clock backed by std::chrono::system_clock
 */
class SystemClock : public ClockInterface {
public:
    std::int64_t nowMillis() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }
};

} // namespace mimeid

#endif // MIMEID_CLOCK_INTERFACE_H
