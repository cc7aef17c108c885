#pragma once
#include <warden/schema/primitives.hpp>
#include <optional>

namespace warden::schema::encoding {

// Encoding backend is chosen at build time through the tag type. Every
// persisted value and every fingerprint goes through this seam, so a backend
// must be deterministic and injective for the tuples it is given.
template <typename Library>
struct encoder {
  template <typename T>
  warden::schema::bytes_t encode(const T& obj);

  /// Encodes the arguments as one tuple, the layout of call arguments.
  template <typename... Args>
  warden::schema::bytes_t encode_tuple(const Args&... args);

  template <typename T>
  void append(const T& obj, warden::schema::bytes_t& out);

  /// Persisted values only. Malformed bytes are fatal.
  template <typename T>
  T decode(const warden::schema::bytes_view_t& bytes);

  /// Caller supplied bytes. Malformed or trailing bytes yield nullopt.
  template <typename T>
  std::optional<T> try_decode(const warden::schema::bytes_view_t& bytes);
};

}  // namespace warden::schema::encoding
