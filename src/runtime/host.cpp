#include <spdlog/spdlog.h>
#include <warden/common/critical.hpp>
#include <warden/runtime/host.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <utility>

namespace warden::runtime {

namespace {

struct depth_guard final {
  explicit depth_guard(std::size_t& depth) : depth_{depth} { ++depth_; }
  ~depth_guard() { --depth_; }

  depth_guard(const depth_guard&) = delete;
  depth_guard& operator=(const depth_guard&) = delete;

  std::size_t& depth_;
};

}  // namespace

host::host(warden::state::journal& journal, clock_source_t clock)
    : journal_{journal}, clock_{std::move(clock)} {
  if (!clock_) {
    warden::common::critical("host requires a clock source");
  }
}

warden::schema::timestamp_seconds_t host::now() const {
  if (pinned_now_) {
    return *pinned_now_;
  }
  return clock_();
}

warden::state::journal& host::journal() {
  return journal_;
}

const warden::state::journal& host::journal() const {
  return journal_;
}

warden::schema::amount_t host::balance_of(
    const warden::schema::account_id_t& account) const {
  auto key = warden::schema::key::make_balance_key(account);
  auto stored = journal_.read<warden::schema::hash32_t>(
      warden::schema::bytes_view_t{key.data(), key.size()});
  if (!stored) {
    return warden::schema::amount_t{};
  }
  return warden::schema::from_bytes32(*stored);
}

void host::deposit(const warden::schema::account_id_t& to,
                   const warden::schema::amount_t& value) {
  auto frame = warden::state::scope{journal_};
  auto current = balance_of(to);
  auto updated = current + value;
  if (updated < current) {
    warden::common::critical("native supply overflow");
  }
  write_balance(to, updated);
  frame.commit();
  spdlog::debug("Deposited {} to {}", warden::schema::to_string(value),
                warden::schema::to_hex(to));
}

bool host::transfer(const warden::schema::account_id_t& from,
                    const warden::schema::account_id_t& to,
                    const warden::schema::amount_t& value) {
  if (value == 0 || from == to) {
    return balance_of(from) >= value;
  }
  auto from_balance = balance_of(from);
  if (from_balance < value) {
    return false;
  }
  write_balance(from, from_balance - value);
  // Total native supply fits in 256 bits, so the credit cannot wrap.
  write_balance(to, balance_of(to) + value);
  return true;
}

call_outcome_t host::invoke(const warden::schema::account_id_t& caller,
                            const warden::schema::account_id_t& target,
                            const warden::schema::amount_t& value,
                            const warden::schema::bytes_view_t& payload) {
  if (depth_ >= kMaxCallDepth) {
    spdlog::warn("Invoke rejected: call depth {} exceeded", kMaxCallDepth);
    return call_outcome_t{};
  }
  auto guard = depth_guard{depth_};
  auto frame = warden::state::scope{journal_};

  if (!transfer(caller, target, value)) {
    spdlog::debug("Invoke failed: {} cannot cover {}",
                  warden::schema::to_hex(caller),
                  warden::schema::to_string(value));
    return call_outcome_t{};
  }

  auto outcome = call_outcome_t{.success = true, .return_data = {}};
  auto installed = contracts_.find(target);
  if (installed != std::end(contracts_)) {
    outcome = installed->second->handle(
        call_context_t{
            .caller = caller, .self = target, .value = value, .now = now()},
        payload);
  }

  if (outcome.success) {
    frame.commit();
  }
  return outcome;
}

void host::install(const warden::schema::account_id_t& address,
                   contract& code) {
  contracts_.insert_or_assign(address, &code);
}

void host::uninstall(const warden::schema::account_id_t& address) {
  contracts_.erase(address);
}

bool host::has_code(const warden::schema::account_id_t& address) const {
  return contracts_.contains(address);
}

void host::write_balance(const warden::schema::account_id_t& account,
                         const warden::schema::amount_t& value) {
  auto key = warden::schema::key::make_balance_key(account);
  journal_.write(warden::schema::bytes_view_t{key.data(), key.size()},
                 warden::schema::to_bytes32(value));
}

clock_frame::clock_frame(host& host)
    : host_{host}, owner_{!host.pinned_now_.has_value()} {
  if (owner_) {
    host_.pinned_now_ = host_.clock_();
  }
}

clock_frame::~clock_frame() {
  if (owner_) {
    host_.pinned_now_.reset();
  }
}

warden::schema::timestamp_seconds_t clock_frame::now() const {
  return *host_.pinned_now_;
}

}  // namespace warden::runtime
