#include "util/ids.hpp"
#include <fmt/core.h>
#include <mutex>
#include <random>

namespace royaos::util {

std::string generate_token(const std::string& prefix) {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = rng();
        lo = rng();
    }
    return fmt::format("{}-{:016x}{:016x}", prefix, hi, lo);
}

} // namespace royaos::util
