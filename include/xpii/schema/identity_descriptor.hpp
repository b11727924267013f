#pragma once

#include <xpii/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: identity descriptor.
// Governance workflow: exported view of an agent identity; carries no seed.
namespace xpii::schema {

template <uint16_t Version>
struct identity_descriptor;

template <>
struct identity_descriptor<1> final {
  uint16_t version{1};
  std::string identity_id;
  std::string name;
  timestamp_t created_at;
  bool revoked{};
};

using identity_descriptor_t = identity_descriptor<1>;

}  // namespace xpii::schema
