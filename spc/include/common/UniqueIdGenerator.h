#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace SPC {

/**
 * @brief Thread-safe generator for session and subscription identifiers
 *
 * Generated IDs have the form `prefix_timestamp_counter_randomhex`. The global
 * counter guarantees uniqueness within the process; the timestamp and random
 * component keep IDs from different processes apart in merged logs.
 */
class UniqueIdGenerator {
public:
    /**
     * @brief Generate a survey session identity
     * @param prefix Prefix for the ID (default "session")
     */
    static std::string generateSessionId(const std::string &prefix = "session");

    /**
     * @brief Generate a generic unique ID
     */
    static std::string generateUniqueId(const std::string &prefix);

    /**
     * @brief Numeric ID used for subscriber bookkeeping
     */
    static uint64_t generateSubscriptionId();

    /**
     * @brief Check whether an ID has the `prefix_timestamp_counter_random` shape
     */
    static bool isGeneratedId(const std::string &id);

    /**
     * @brief Reset counters and seed the RNG deterministically (tests only)
     */
    static void resetForTesting();

    static uint64_t getSessionIdCount() {
        return sessionIdCount_.load();
    }

private:
    static std::string generateBaseId(const std::string &prefix, std::atomic<uint64_t> &counterRef);
    static uint64_t getCurrentTimestamp();
    static uint64_t getRandomComponent();

    static std::atomic<uint64_t> globalCounter_;
    static std::atomic<uint64_t> sessionIdCount_;
    static std::atomic<uint64_t> genericIdCount_;
    static std::atomic<uint64_t> subscriptionCounter_;

    static std::mt19937_64 rng_;
    static std::mutex rngMutex_;
};

}  // namespace SPC
