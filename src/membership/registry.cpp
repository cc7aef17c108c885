#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/membership/registry.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

namespace warden::membership {

namespace {

using encoder_t = warden::schema::encoding::scale_encoder_t;
using roles_t =
    std::tuple<warden::schema::account_id_t, warden::schema::account_id_t>;

warden::schema::bytes_view_t view(const warden::schema::bytes_t& bytes) {
  return warden::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

registry::registry(warden::runtime::host& host,
                   warden::schema::account_id_t address)
    : host_{host}, address_{address} {
  host_.install(address_, *this);
}

registry::~registry() {
  host_.uninstall(address_);
}

void registry::configure(const warden::schema::account_id_t& minter,
                         const warden::schema::account_id_t& burner) {
  auto frame = warden::state::scope{host_.journal()};
  host_.journal().write(
      view(warden::schema::key::make_membership_roles_key(address_)),
      roles_t{minter, burner});
  frame.commit();
}

const warden::schema::account_id_t& registry::address() const {
  return address_;
}

uint64_t registry::total_supply() const {
  return host_.journal()
      .read<uint64_t>(
          view(warden::schema::key::make_membership_supply_key(address_)))
      .value_or(0);
}

std::optional<warden::schema::account_id_t> registry::owner_of(
    const warden::schema::unit_id_t unit) const {
  return host_.journal().read<warden::schema::account_id_t>(
      view(warden::schema::key::make_unit_owner_key(address_, unit)));
}

warden::schema::result_t<warden::schema::unit_id_t> registry::mint(
    const warden::schema::account_id_t& caller,
    const warden::schema::account_id_t& to) {
  auto configured = roles();
  if (!configured || std::get<0>(*configured) != caller) {
    return warden::schema::make_error(
        warden::schema::error_code::caller_not_minter,
        "registry::mint: caller is not the minter");
  }

  auto frame = warden::state::scope{host_.journal()};
  auto& journal = host_.journal();
  auto next_key = warden::schema::key::make_membership_next_unit_key(address_);
  auto unit = journal.read<uint64_t>(view(next_key)).value_or(0);
  journal.write(view(next_key), unit + 1);
  journal.write(view(warden::schema::key::make_unit_owner_key(address_, unit)),
                to);
  journal.write(view(warden::schema::key::make_membership_supply_key(address_)),
                total_supply() + 1);
  frame.commit();

  spdlog::info("Minted membership unit {} to {}", unit,
               warden::schema::to_hex(to));
  return unit;
}

std::optional<warden::schema::error_t> registry::burn(
    const warden::schema::account_id_t& caller,
    const warden::schema::unit_id_t unit) {
  auto owner = owner_of(unit);
  if (!owner) {
    return warden::schema::make_error(warden::schema::error_code::unit_missing,
                                      "registry::burn: unit does not exist");
  }
  auto configured = roles();
  auto is_burner = configured && std::get<1>(*configured) == caller;
  if (*owner != caller && !is_burner) {
    return warden::schema::make_error(
        warden::schema::error_code::caller_not_unit_owner,
        "registry::burn: caller is neither owner nor burner");
  }

  auto frame = warden::state::scope{host_.journal()};
  host_.journal().erase(
      view(warden::schema::key::make_unit_owner_key(address_, unit)));
  host_.journal().write(
      view(warden::schema::key::make_membership_supply_key(address_)),
      total_supply() - 1);
  frame.commit();

  spdlog::info("Burned membership unit {}", unit);
  return std::nullopt;
}

warden::runtime::call_outcome_t registry::handle(
    const warden::runtime::call_context_t& context,
    const warden::schema::bytes_view_t& payload) {
  auto selector = warden::schema::selector_t{};
  if (payload.size() < selector.size()) {
    return warden::runtime::call_outcome_t{};
  }
  std::copy_n(std::begin(payload), selector.size(), std::begin(selector));
  auto arguments = payload.subspan(selector.size());
  auto encoder = encoder_t{};

  if (selector == warden::blake3::selector(kBurnSignature)) {
    auto decoded = encoder.try_decode<std::tuple<uint64_t>>(arguments);
    if (!decoded) {
      return warden::runtime::call_outcome_t{};
    }
    auto error = burn(context.caller, std::get<0>(*decoded));
    if (error) {
      spdlog::debug("Burn via invoke rejected: {}", error->log);
    }
    return warden::runtime::call_outcome_t{.success = !error.has_value(),
                                           .return_data = {}};
  }

  if (selector == warden::blake3::selector(kMintSignature)) {
    auto decoded =
        encoder.try_decode<std::tuple<warden::schema::account_id_t>>(arguments);
    if (!decoded) {
      return warden::runtime::call_outcome_t{};
    }
    auto minted = mint(context.caller, std::get<0>(*decoded));
    if (warden::schema::is_error(minted)) {
      return warden::runtime::call_outcome_t{};
    }
    return warden::runtime::call_outcome_t{
        .success = true,
        .return_data = encoder.encode(warden::schema::value_of(minted))};
  }

  return warden::runtime::call_outcome_t{};
}

std::optional<std::pair<warden::schema::account_id_t,
                        warden::schema::account_id_t>>
registry::roles() const {
  auto stored = host_.journal().read<roles_t>(
      view(warden::schema::key::make_membership_roles_key(address_)));
  if (!stored) {
    return std::nullopt;
  }
  return std::pair{std::get<0>(*stored), std::get<1>(*stored)};
}

}  // namespace warden::membership
