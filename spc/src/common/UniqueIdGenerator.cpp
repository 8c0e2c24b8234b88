#include "common/UniqueIdGenerator.h"
#include "common/Logger.h"

#include <cctype>
#include <chrono>
#include <sstream>

namespace SPC {

std::atomic<uint64_t> UniqueIdGenerator::globalCounter_{0};
std::atomic<uint64_t> UniqueIdGenerator::sessionIdCount_{0};
std::atomic<uint64_t> UniqueIdGenerator::genericIdCount_{0};
std::atomic<uint64_t> UniqueIdGenerator::subscriptionCounter_{1};
std::mt19937_64 UniqueIdGenerator::rng_{std::random_device{}()};
std::mutex UniqueIdGenerator::rngMutex_;

std::string UniqueIdGenerator::generateSessionId(const std::string &prefix) {
    return generateBaseId(prefix.empty() ? "session" : prefix, sessionIdCount_);
}

std::string UniqueIdGenerator::generateUniqueId(const std::string &prefix) {
    return generateBaseId(prefix, genericIdCount_);
}

uint64_t UniqueIdGenerator::generateSubscriptionId() {
    return subscriptionCounter_.fetch_add(1);
}

bool UniqueIdGenerator::isGeneratedId(const std::string &id) {
    if (id.empty()) {
        return false;
    }

    // Prefixes are free-form, so count separators from the end
    size_t randomSep = id.rfind('_');
    if (randomSep == std::string::npos || randomSep == 0 || randomSep + 1 == id.size()) {
        return false;
    }
    size_t counterSep = id.rfind('_', randomSep - 1);
    if (counterSep == std::string::npos || counterSep == 0) {
        return false;
    }
    size_t timestampSep = id.rfind('_', counterSep - 1);
    if (timestampSep == std::string::npos || timestampSep == 0) {
        return false;
    }

    auto allDigits = [&id](size_t from, size_t to) {
        if (from >= to) {
            return false;
        }
        for (size_t i = from; i < to; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(id[i]))) {
                return false;
            }
        }
        return true;
    };

    return allDigits(timestampSep + 1, counterSep) && allDigits(counterSep + 1, randomSep);
}

void UniqueIdGenerator::resetForTesting() {
    LOG_DEBUG("UniqueIdGenerator: Resetting counters for testing");
    globalCounter_.store(0);
    sessionIdCount_.store(0);
    genericIdCount_.store(0);

    std::lock_guard<std::mutex> lock(rngMutex_);
    rng_.seed(12345);
}

std::string UniqueIdGenerator::generateBaseId(const std::string &prefix, std::atomic<uint64_t> &counterRef) {
    uint64_t typeCounter = counterRef.fetch_add(1);
    uint64_t globalCount = globalCounter_.fetch_add(1);

    std::ostringstream oss;
    oss << prefix << "_" << getCurrentTimestamp() << "_" << globalCount << "_" << std::hex << getRandomComponent();

    std::string id = oss.str();
    LOG_TRACE("UniqueIdGenerator: Generated ID: {} (type counter: {})", id, typeCounter);
    return id;
}

uint64_t UniqueIdGenerator::getCurrentTimestamp() {
    auto duration = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

uint64_t UniqueIdGenerator::getRandomComponent() {
    std::lock_guard<std::mutex> lock(rngMutex_);
    // Lower 16 bits keep IDs short
    return rng_() & 0xFFFF;
}

}  // namespace SPC
