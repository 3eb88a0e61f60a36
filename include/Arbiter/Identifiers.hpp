// =================================================================
// include/Arbiter/Identifiers.hpp
// =================================================================
// Audit identifiers and stable hashing used for seeds and bucketing.

#pragma once

#include <string>
#include <cstdint>

namespace Arbiter {

/**
 * @brief 64-bit FNV-1a hash of a string
 */
uint64_t fnv1a64(const std::string& text);

/**
 * @brief 32-bit FNV-1a hash of a string
 */
uint32_t fnv1a32(const std::string& text);

/**
 * @brief Random UUID v4 in canonical 8-4-4-4-12 form
 */
std::string generateAuditId();

} // namespace Arbiter
