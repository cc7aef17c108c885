#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using selector_t = std::array<uint8_t, 4>;
using account_id_t = hash32_t;
using fingerprint_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using wide_amount_t = boost::multiprecision::uint512_t;
using unit_id_t = uint64_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;
using basis_points_t = uint32_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& hash);

/// Fixed-width big-endian form used for hashing and persistence.
hash32_t to_bytes32(const amount_t& value);
amount_t from_bytes32(const hash32_t& bytes);

/// Parse a base-10 unsigned integer that fits in 256 bits.
std::optional<amount_t> try_parse_amount(const std::string_view decimal);
std::string to_string(const amount_t& value);

}  // namespace warden::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
