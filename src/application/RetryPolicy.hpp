/**
 * @file RetryPolicy.hpp
 * @brief Fixed attempt budget and jittered backoff of the generation loop.
 */

#pragma once

#include <chrono>
#include <functional>
#include <random>
#include <thread>

namespace smartcook::application {

struct RetryPolicy {
    static constexpr int kMaxAttempts = 4;
    static constexpr std::chrono::milliseconds kMinBackoff{600};
    static constexpr std::chrono::milliseconds kMaxBackoff{1400};

    /// Blocking wait between attempts. Tests inject a recorder.
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /** @brief Uniform delay in [kMinBackoff, kMaxBackoff]. */
    static std::chrono::milliseconds JitteredBackoff(std::mt19937& rng) {
        std::uniform_int_distribution<long long> dist(kMinBackoff.count(), kMaxBackoff.count());
        return std::chrono::milliseconds(dist(rng));
    }

    static Sleeper ThreadSleeper() {
        return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
};

} // namespace smartcook::application
