#pragma once
#include <ballot/schema/primitives.hpp>
#include <cstdint>

// Schema type: transfer administrator.
// Governance workflow: Current administrator hands its authority to another
// non-null address in a single step.
namespace ballot::schema {

template <uint16_t Version>
struct transfer_administrator;

template <>
struct transfer_administrator<1> final {
  uint16_t version{1};
  address_t new_administrator{};
};

using transfer_administrator_t = transfer_administrator<1>;

}  // namespace ballot::schema
