#pragma once

#include <warden/blake3/hash.hpp>
#include <warden/schema/action.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/primitives.hpp>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>

namespace warden::timelock {

/// Content address of an action: BLAKE3 over the SCALE encoding of
/// (target, value as 32 bytes big-endian, signature, data, eta).
warden::schema::fingerprint_t make_fingerprint(
    const warden::schema::action_t& action);

/// Bytes handed to the invoke primitive: `data` unchanged when the signature
/// is empty, otherwise selector(signature) followed by `data`.
warden::schema::bytes_t make_call_payload(
    const warden::schema::action_t& action);

/// Split a payload into selector and argument bytes. Empty when the payload
/// is shorter than a selector.
std::optional<std::pair<warden::schema::selector_t, warden::schema::bytes_view_t>>
split_payload(const warden::schema::bytes_view_t& payload);

/// SCALE encoded argument tuple, the `data` half of a signed call.
template <typename... Args>
warden::schema::bytes_t encode_arguments(const Args&... args) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  return encoder.encode_tuple(args...);
}

/// Complete payload for a call: selector followed by encoded arguments.
template <typename... Args>
warden::schema::bytes_t encode_call(const std::string_view signature,
                                    const Args&... args) {
  auto selector = warden::blake3::selector(signature);
  auto payload =
      warden::schema::bytes_t{std::begin(selector), std::end(selector)};
  auto arguments = encode_arguments(args...);
  payload.insert(std::end(payload), std::begin(arguments), std::end(arguments));
  return payload;
}

}  // namespace warden::timelock
