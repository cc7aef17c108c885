#pragma once

#include <warden/execution/engine.hpp>
#include <warden/governance/proposal_book.hpp>
#include <warden/membership/registry.hpp>
#include <warden/runtime/host.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/state/journal.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <warden/testing/common.hpp>
#include <warden/timelock/admin_authority.hpp>

#include <string>
#include <string_view>

namespace warden::testing {

inline constexpr auto kGenesisTime = warden::schema::timestamp_seconds_t{
    1'700'000'000};

/// Full system over a throwaway RocksDB directory with a clock the test
/// drives by hand.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        storage_{warden::storage::make_storage<
            warden::storage::rocksdb_storage_tag>(db_path_)},
        journal_{storage_},
        host_{journal_, [this] { return now_; }},
        registry_{host_, registry_address()},
        proposals_{journal_, governor_address()},
        engine_{host_, registry_, proposals_, treasury_address()} {}

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  static warden::schema::account_id_t admin() { return make_account(0xA1); }
  static warden::schema::account_id_t minter() { return make_account(0xB1); }
  static warden::schema::account_id_t outsider() { return make_account(0xC1); }
  static warden::schema::account_id_t treasury_address() {
    return make_account(0xE1);
  }
  static warden::schema::account_id_t registry_address() {
    return make_account(0xE2);
  }
  static warden::schema::account_id_t governor_address() {
    return make_account(0xE3);
  }

  /// Initialize with the minimum delay, configure the registry roles and
  /// return the initialize result.
  warden::schema::call_result_t initialize(
      const warden::schema::basis_points_t rate = 5000,
      const warden::schema::duration_seconds_t delay =
          warden::timelock::kMinimumDelay) {
    auto result = engine_.initialize(warden::execution::genesis_t{
        .admin = admin(), .delay = delay, .redemption_rate = rate});
    registry_.configure(minter(), treasury_address());
    return result;
  }

  warden::schema::unit_id_t mint_to(const warden::schema::account_id_t& owner) {
    return warden::schema::value_of(registry_.mint(minter(), owner));
  }

  void fund_treasury(const warden::schema::amount_t& value) {
    host_.deposit(treasury_address(), value);
  }

  warden::schema::timestamp_seconds_t now() const { return now_; }
  void set_now(const warden::schema::timestamp_seconds_t now) { now_ = now; }
  void advance(const warden::schema::duration_seconds_t seconds) {
    now_ += seconds;
  }

  const std::string& db_path() const { return db_path_; }
  warden::state::journal& journal() { return journal_; }
  warden::runtime::host& host() { return host_; }
  warden::membership::registry& registry() { return registry_; }
  warden::governance::proposal_book& proposals() { return proposals_; }
  warden::execution::engine& engine() { return engine_; }

 private:
  std::string db_path_;
  warden::schema::timestamp_seconds_t now_{kGenesisTime};
  warden::state::storage_t storage_;
  warden::state::journal journal_;
  warden::runtime::host host_;
  warden::membership::registry registry_;
  warden::governance::proposal_book proposals_;
  warden::execution::engine engine_;
};

}  // namespace warden::testing
