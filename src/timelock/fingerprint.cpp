#include <warden/timelock/fingerprint.hpp>
#include <algorithm>

namespace warden::timelock {

warden::schema::fingerprint_t make_fingerprint(
    const warden::schema::action_t& action) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto material = encoder.encode_tuple(
      action.target, warden::schema::to_bytes32(action.value),
      action.signature, action.data, action.eta);
  return warden::blake3::hash(
      warden::schema::bytes_view_t{material.data(), material.size()});
}

warden::schema::bytes_t make_call_payload(
    const warden::schema::action_t& action) {
  if (action.signature.empty()) {
    return action.data;
  }
  auto selector = warden::blake3::selector(action.signature);
  auto payload = warden::schema::bytes_t{};
  payload.reserve(selector.size() + action.data.size());
  payload.insert(std::end(payload), std::begin(selector), std::end(selector));
  payload.insert(std::end(payload), std::begin(action.data),
                 std::end(action.data));
  return payload;
}

std::optional<std::pair<warden::schema::selector_t, warden::schema::bytes_view_t>>
split_payload(const warden::schema::bytes_view_t& payload) {
  auto selector = warden::schema::selector_t{};
  if (payload.size() < selector.size()) {
    return std::nullopt;
  }
  std::copy_n(std::begin(payload), selector.size(), std::begin(selector));
  return std::pair{selector, payload.subspan(selector.size())};
}

}  // namespace warden::timelock
