#pragma once

#include <xpii/schema/verification_result.hpp>

#include <filesystem>
#include <string_view>

namespace xpii::provenance {

/// Value reported for a creator or modified time the package does not carry.
inline constexpr auto kUnknownField = std::string_view{"Unknown"};

/// Read the provenance embedded in a stapled package.
///
/// Only `docProps/core.xml` is read and the package is never modified.
/// Invalid zips and unparsable XML are reported as `malformed_archive`.
xpii::schema::verification_result_t verify(
    const std::filesystem::path& package_path);

}  // namespace xpii::provenance
