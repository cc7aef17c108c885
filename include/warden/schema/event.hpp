#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: event.
// Treasury workflow: append-only audit notification emitted by a committed
// operation (admin changes, queue/cancel/execute, redemptions).
namespace warden::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using event_attribute_t = event_attribute<1>;

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;
};

using event_t = event<1>;

template <uint16_t Version>
struct event_record;

/// Persisted form of an event. `sequence` numbers the top-level operation
/// that committed it.
template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t sequence{};
  event_t event;
};

using event_record_t = event_record<1>;

inline constexpr auto kNewAdminEvent = std::string_view{"new_admin"};
inline constexpr auto kNewPendingAdminEvent =
    std::string_view{"new_pending_admin"};
inline constexpr auto kNewDelayEvent = std::string_view{"new_delay"};
inline constexpr auto kQueueTransactionEvent =
    std::string_view{"queue_transaction"};
inline constexpr auto kCancelTransactionEvent =
    std::string_view{"cancel_transaction"};
inline constexpr auto kExecuteTransactionEvent =
    std::string_view{"execute_transaction"};
inline constexpr auto kNewRedemptionRateEvent =
    std::string_view{"new_redemption_rate"};
inline constexpr auto kRedemptionEvent = std::string_view{"redemption"};

/// Attribute value for `key`, or empty when absent.
inline std::string_view find_attribute(const event_t& event,
                                       const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return {};
}

}  // namespace warden::schema
