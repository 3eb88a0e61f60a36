// =================================================================
// src/Arbiter/Identifiers.cpp
// =================================================================
// Implementation of identifier helpers.

#include "Arbiter/Identifiers.hpp"
#include <random>
#include <sstream>
#include <iomanip>

namespace Arbiter {

uint64_t fnv1a64(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

uint32_t fnv1a32(const std::string& text) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

std::string generateAuditId() {
    thread_local std::mt19937_64 generator{std::random_device{}()};

    uint64_t high = generator();
    uint64_t low = generator();

    // Version 4, RFC 4122 variant
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << static_cast<uint32_t>(high >> 32) << '-'
        << std::setw(4) << static_cast<uint32_t>((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << static_cast<uint32_t>(high & 0xFFFF) << '-'
        << std::setw(4) << static_cast<uint32_t>(low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

} // namespace Arbiter
