#pragma once
#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace warden::blake3 {

warden::schema::hash32_t hash(const std::string_view& str);
warden::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Leading four bytes of the digest of a call signature such as
/// "setDelay(uint64)".
warden::schema::selector_t selector(const std::string_view& signature);

}  // namespace warden::blake3
