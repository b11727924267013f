#pragma once

#include <xpii/common/error.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <tinyxml2.h>

// Part-level XML helpers over tinyxml2.
// Parts keep their whitespace, whitespace-only text runs included, and are
// written back compact with a declaration.
namespace xpii::package::xml {

inline constexpr auto kWordprocessingNamespace = std::string_view{
    "http://schemas.openxmlformats.org/wordprocessingml/2006/main"};
inline constexpr auto kCorePropertiesNamespace = std::string_view{
    "http://schemas.openxmlformats.org/package/2006/metadata/"
    "core-properties"};
inline constexpr auto kDublinCoreNamespace =
    std::string_view{"http://purl.org/dc/elements/1.1/"};
inline constexpr auto kDublinCoreTermsNamespace =
    std::string_view{"http://purl.org/dc/terms/"};
inline constexpr auto kSchemaInstanceNamespace =
    std::string_view{"http://www.w3.org/2001/XMLSchema-instance"};
inline constexpr auto kMathNamespace = std::string_view{
    "http://schemas.openxmlformats.org/officeDocument/2006/math"};
inline constexpr auto kSchemaLibraryNamespace = std::string_view{
    "http://schemas.openxmlformats.org/schemaLibrary/2006/main"};

/// Document configured for part round-trips.
std::unique_ptr<tinyxml2::XMLDocument> make_document();

/// Parse `text`. Fails with `malformed_archive` carrying the parser message.
bool parse(tinyxml2::XMLDocument& document,
           std::string_view text,
           std::string_view part,
           xpii::common::error& error);

/// Read and parse a part file.
bool load(tinyxml2::XMLDocument& document,
          const std::filesystem::path& file,
          std::string_view part,
          xpii::common::error& error);

/// Serialize compact, adding `<?xml version="1.0" encoding="UTF-8"?>` when the
/// document has no declaration.
std::string serialize(tinyxml2::XMLDocument& document);

/// Serialize to `file`. Fails with `io_error`.
bool save(tinyxml2::XMLDocument& document,
          const std::filesystem::path& file,
          xpii::common::error& error);

/// Prefix bound to `uri` on `element`; empty string for a default namespace.
std::optional<std::string> find_prefix(const tinyxml2::XMLElement& element,
                                       std::string_view uri);

/// Namespace URI of `element`'s own name, resolved through the xmlns
/// declarations on it and its ancestors. std::nullopt when unbound.
std::optional<std::string> namespace_of(const tinyxml2::XMLElement& element);

/// Name without its prefix.
std::string_view local_name(const tinyxml2::XMLElement& element);

/// Prefix bound to `uri` on `element`, declaring `preferred` (or a numbered
/// variant when `preferred` is bound elsewhere) if there is no binding.
std::string ensure_prefix(tinyxml2::XMLElement& element,
                          std::string_view uri,
                          std::string_view preferred);

/// `prefix:local`, or `local` for an empty prefix.
std::string qualify(std::string_view prefix, std::string_view local);

/// First child named `name`, appended when missing.
tinyxml2::XMLElement* ensure_child(tinyxml2::XMLElement& parent,
                                   const std::string& name);

/// Text content of an element, empty when the element has none.
std::string text_of(const tinyxml2::XMLElement& element);

}  // namespace xpii::package::xml
