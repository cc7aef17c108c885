#include <warden/schema/key/engine_keys.hpp>
#include <warden/timelock/queued_set.hpp>

namespace warden::timelock {

queued_set::queued_set(warden::state::journal& journal) : journal_{journal} {}

bool queued_set::contains(
    const warden::schema::fingerprint_t& fingerprint) const {
  auto key = warden::schema::key::make_queued_key(fingerprint);
  return journal_
      .read<bool>(warden::schema::bytes_view_t{key.data(), key.size()})
      .value_or(false);
}

void queued_set::set(const warden::schema::fingerprint_t& fingerprint,
                     const bool queued) {
  auto key = warden::schema::key::make_queued_key(fingerprint);
  auto key_view = warden::schema::bytes_view_t{key.data(), key.size()};
  if (queued) {
    journal_.write(key_view, true);
  } else {
    journal_.erase(key_view);
  }
}

}  // namespace warden::timelock
