#include <warden/schema/key/engine_keys.hpp>

#include <iterator>

namespace warden::schema::key {

namespace {

void append_big_endian(warden::schema::bytes_t& out, const uint64_t value) {
  for (auto shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<uint8_t>((value >> shift) & 0xFFu));
  }
}

warden::schema::bytes_t make_account_key(
    const std::string_view prefix,
    const warden::schema::account_id_t& account) {
  return make_prefixed_key(
      prefix, warden::schema::bytes_view_t{account.data(), account.size()});
}

}  // namespace

warden::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const warden::schema::bytes_view_t& id) {
  auto key = warden::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

warden::schema::bytes_t make_key(std::string_view key) {
  return warden::schema::make_bytes(key);
}

warden::schema::bytes_t make_queued_key(
    const warden::schema::fingerprint_t& fingerprint) {
  return make_account_key(kQueuedKeyPrefix, fingerprint);
}

warden::schema::bytes_t make_balance_key(
    const warden::schema::account_id_t& account) {
  return make_account_key(kBalanceKeyPrefix, account);
}

warden::schema::bytes_t make_unit_owner_key(
    const warden::schema::account_id_t& registry,
    const warden::schema::unit_id_t unit) {
  auto key = make_account_key(kUnitOwnerKeyPrefix, registry);
  append_big_endian(key, unit);
  return key;
}

warden::schema::bytes_t make_membership_supply_key(
    const warden::schema::account_id_t& registry) {
  return make_account_key(kMembershipSupplyKeyPrefix, registry);
}

warden::schema::bytes_t make_membership_next_unit_key(
    const warden::schema::account_id_t& registry) {
  return make_account_key(kMembershipNextUnitKeyPrefix, registry);
}

warden::schema::bytes_t make_membership_roles_key(
    const warden::schema::account_id_t& registry) {
  return make_account_key(kMembershipRolesKeyPrefix, registry);
}

warden::schema::bytes_t make_proposal_count_key(
    const warden::schema::account_id_t& book) {
  return make_account_key(kProposalCountKeyPrefix, book);
}

warden::schema::bytes_t make_proposal_key(
    const warden::schema::account_id_t& book,
    const uint64_t index) {
  auto key = make_account_key(kProposalKeyPrefix, book);
  append_big_endian(key, index);
  return key;
}

warden::schema::bytes_t make_event_key(const uint64_t event_id) {
  auto key = make_key(kEventPrefix);
  append_big_endian(key, event_id);
  return key;
}

std::optional<uint64_t> parse_event_key(
    const warden::schema::bytes_view_t& key) {
  if (key.size() != kEventPrefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  auto prefix = std::string_view{reinterpret_cast<const char*>(key.data()),
                                 kEventPrefix.size()};
  if (prefix != kEventPrefix) {
    return std::nullopt;
  }
  auto value = uint64_t{};
  for (auto i = kEventPrefix.size(); i < key.size(); ++i) {
    value = (value << 8u) | key[i];
  }
  return value;
}

}  // namespace warden::schema::key
