#include <blake3.h>
#include <warden/blake3/hash.hpp>
#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>

namespace warden::blake3 {

namespace {

static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<warden::schema::hash32_t>);

warden::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = warden::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

warden::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

warden::schema::hash32_t hash(const warden::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

warden::schema::selector_t selector(const std::string_view& signature) {
  auto full = hash(signature);
  auto out = warden::schema::selector_t{};
  std::copy_n(std::begin(full), out.size(), std::begin(out));
  return out;
}

}  // namespace warden::blake3
