#pragma once

#include <chrono>
#include <cstdint>

namespace uplink {

class IClock {
public:
    virtual ~IClock() = default;
    
    virtual std::chrono::system_clock::time_point now() const = 0;
    
    int64_t epochMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now().time_since_epoch()).count();
    }
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

// Converts an epoch-millisecond value back into the clock's time_point type
inline std::chrono::system_clock::time_point fromEpochMillis(int64_t millis) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

} // namespace uplink
