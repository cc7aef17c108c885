#pragma once

#include <warden/schema/error_code.hpp>
#include <warden/schema/event.hpp>
#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: call result.
// Treasury workflow: envelope returned by every system entry point. `code`
// is a numeric `error_code`; zero means the operation committed.
namespace warden::schema {

template <uint16_t Version>
struct call_result;

template <>
struct call_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string codespace;
  std::vector<event_t> events;

  bool ok() const { return code == 0; }
  error_code error() const { return static_cast<error_code>(code); }
};

using call_result_t = call_result<1>;

}  // namespace warden::schema
