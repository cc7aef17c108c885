#pragma once
#include <warden/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: proposal actions.
// Treasury workflow: parallel arrays describing the calls an external
// proposal intends to make. All four arrays have equal length.
namespace warden::schema {

template <uint16_t Version>
struct proposal_actions;

template <>
struct proposal_actions<1> final {
  uint16_t version{1};
  std::vector<account_id_t> targets;
  std::vector<amount_t> values;
  std::vector<std::string> signatures;
  std::vector<bytes_t> datas;
};

using proposal_actions_t = proposal_actions<1>;

}  // namespace warden::schema
