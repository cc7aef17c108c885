#pragma once
#include <warden/common/critical.hpp>
#include <warden/schema/encoding/encoder.hpp>
#include <iterator>
#include <tuple>
#include <utility>
#include <scale/scale.hpp>

namespace warden::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  warden::schema::bytes_t encode(const T& obj) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      warden::common::critical("SCALE encoding failed: {}",
                               encoded.error().message());
    }
    return std::move(encoded.value());
  }

  template <typename... Args>
  warden::schema::bytes_t encode_tuple(const Args&... args) {
    return encode(std::tuple<Args...>{args...});
  }

  template <typename T>
  void append(const T& obj, warden::schema::bytes_t& out) {
    auto encoded = encode(obj);
    out.insert(std::end(out), std::begin(encoded), std::end(encoded));
  }

  template <typename T>
  T decode(const warden::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      warden::common::critical("corrupt SCALE value of {} bytes: {}",
                               bytes.size(), decoded.error().message());
    }
    return std::move(decoded.value());
  }

  template <typename T>
  std::optional<T> try_decode(const warden::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }
};

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace warden::schema::encoding
