#pragma once

#include <warden/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Treasury workflow: canonical key prefixes and key codecs for timelock,
// treasury, ledger, collaborator and event state. Integer suffixes are
// big-endian so prefix scans iterate in numeric order.
namespace warden::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAdminKey{"SYS|STATE|TIMELOCK|ADMIN"};
inline constexpr std::string_view kPendingAdminKey{
    "SYS|STATE|TIMELOCK|PENDING_ADMIN"};
inline constexpr std::string_view kDelayKey{"SYS|STATE|TIMELOCK|DELAY"};
inline constexpr std::string_view kQueuedKeyPrefix{
    "SYS|STATE|TIMELOCK|QUEUED|"};
inline constexpr std::string_view kRedemptionRateKey{
    "SYS|STATE|TREASURY|REDEMPTION_RATE"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kUnitOwnerKeyPrefix{
    "SYS|STATE|MEMBERSHIP|OWNER|"};
inline constexpr std::string_view kMembershipSupplyKeyPrefix{
    "SYS|STATE|MEMBERSHIP|SUPPLY|"};
inline constexpr std::string_view kMembershipNextUnitKeyPrefix{
    "SYS|STATE|MEMBERSHIP|NEXT|"};
inline constexpr std::string_view kMembershipRolesKeyPrefix{
    "SYS|STATE|MEMBERSHIP|ROLES|"};
inline constexpr std::string_view kProposalCountKeyPrefix{
    "SYS|STATE|GOVERNANCE|COUNT|"};
inline constexpr std::string_view kProposalKeyPrefix{
    "SYS|STATE|GOVERNANCE|PROPOSAL|"};
inline constexpr std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ|NEXT"};
inline constexpr std::string_view kCommitSeqKey{"SYS|STATE|COMMIT_SEQ|NEXT"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

warden::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const warden::schema::bytes_view_t& id);

warden::schema::bytes_t make_key(std::string_view key);

warden::schema::bytes_t make_queued_key(
    const warden::schema::fingerprint_t& fingerprint);

warden::schema::bytes_t make_balance_key(
    const warden::schema::account_id_t& account);

warden::schema::bytes_t make_unit_owner_key(
    const warden::schema::account_id_t& registry,
    warden::schema::unit_id_t unit);

warden::schema::bytes_t make_membership_supply_key(
    const warden::schema::account_id_t& registry);

warden::schema::bytes_t make_membership_next_unit_key(
    const warden::schema::account_id_t& registry);

warden::schema::bytes_t make_membership_roles_key(
    const warden::schema::account_id_t& registry);

warden::schema::bytes_t make_proposal_count_key(
    const warden::schema::account_id_t& book);

warden::schema::bytes_t make_proposal_key(
    const warden::schema::account_id_t& book,
    uint64_t index);

warden::schema::bytes_t make_event_key(uint64_t event_id);

std::optional<uint64_t> parse_event_key(const warden::schema::bytes_view_t& key);

}  // namespace warden::schema::key
