#pragma once
#include <xpii/schema/primitives.hpp>
#include <optional>
#include <span>

namespace xpii::schema::encoding {

// The codec is a build-time choice: callers name the library tag, e.g.
// encoder<scale_encoder_tag>. Audit hashing and audit storage must agree on
// the tag, since the chain is computed over the encoded bytes.
template <typename Library>
struct encoder {
  template <typename T>
  xpii::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, xpii::schema::bytes_t& out);

  template <typename T>
  T decode(const xpii::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const xpii::schema::bytes_view_t& bytes);
};

}  // namespace xpii::schema::encoding
