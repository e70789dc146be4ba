/**
 * @file identity.cpp
 * @brief UUID v4 generation and wall-clock timestamps
 */

#include "omnireader/identity.hpp"

#include <chrono>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace omnireader {

namespace {

std::mutex generatorMutex;

std::mt19937_64& generator() {
    static std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

} // namespace

std::string generateId() {
    uint64_t a = 0;
    uint64_t b = 0;
    {
        std::lock_guard<std::mutex> lock(generatorMutex);
        std::uniform_int_distribution<uint64_t> dis;
        a = dis(generator());
        b = dis(generator());
    }

    // Version nibble 4, variant bits 10
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << ((a >> 32) & 0xFFFFFFFF) << "-";
    ss << std::setw(4) << ((a >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (a & 0xFFFF) << "-";
    ss << std::setw(4) << ((b >> 48) & 0xFFFF) << "-";
    ss << std::setw(12) << (b & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

int64_t nowSeconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace omnireader
