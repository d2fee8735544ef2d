// include/brazier/Clock.h
#pragma once

#include <algorithm>
#include <chrono>
#include <thread>

namespace brazier {

// Every wait in the controller goes through this interface so runs can be
// replayed on simulated time.
class IClock {
public:
    virtual ~IClock() = default;

    virtual double now() = 0;                 // seconds, monotonic
    virtual void   sleep(double seconds) = 0;
};

class SteadyClock final : public IClock {
public:
    SteadyClock() : start_(std::chrono::steady_clock::now()) {}

    double now() override
    {
        const auto dt = std::chrono::steady_clock::now() - start_;
        return std::chrono::duration<double>(dt).count();
    }

    void sleep(double seconds) override
    {
        if (seconds <= 0.0)
            return;
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Simulated time: sleep() advances the clock instantly.
class ManualClock final : public IClock {
public:
    explicit ManualClock(double start = 0.0) noexcept : t_(start) {}

    double now() override { return t_; }
    void   sleep(double seconds) override { t_ += std::max(0.0, seconds); }

    void advance(double seconds) noexcept { t_ += std::max(0.0, seconds); }
    void set(double t) noexcept { t_ = t; }

private:
    double t_ = 0.0;
};

} // namespace brazier
