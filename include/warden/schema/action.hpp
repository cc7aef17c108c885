#pragma once
#include <warden/schema/primitives.hpp>
#include <string>

// Schema type: action.
// Treasury workflow: administrative call proposed to the timelock. Only its
// fingerprint is ever persisted.
namespace warden::schema {

template <uint16_t Version>
struct action;

template <>
struct action<1> final {
  uint16_t version{1};
  account_id_t target{};
  amount_t value{};
  std::string signature;
  bytes_t data;
  timestamp_seconds_t eta{};
};

using action_t = action<1>;

}  // namespace warden::schema
