#pragma once

#include <xpii/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: provenance record.
// Stapling workflow: the author/session/fingerprint tuple embedded into
// docProps/core.xml and recovered by the verifier.
namespace xpii::schema {

template <uint16_t Version>
struct provenance_record;

template <>
struct provenance_record<1> final {
  uint16_t version{1};
  std::string author;
  std::string session_id;
  hex_digest_t fingerprint;
  timestamp_t modified_at;
};

using provenance_record_t = provenance_record<1>;

}  // namespace xpii::schema
