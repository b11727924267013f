#pragma once

#include <xpii/schema/primitives.hpp>
#include <xpii/schema/provenance_record.hpp>
#include <xpii/schema/verification_status.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

// Schema type: verification result.
// Stapling workflow: outcome of reading provenance back out of a package.
namespace xpii::schema {

template <uint16_t Version>
struct verification_result;

template <>
struct verification_result<1> final {
  uint16_t version{1};
  verification_status_t status{verification_status_t::no_metadata};
  std::optional<provenance_record_t> record;
  std::map<std::string, std::string> fields;
  std::string error;
};

using verification_result_t = verification_result<1>;

}  // namespace xpii::schema
