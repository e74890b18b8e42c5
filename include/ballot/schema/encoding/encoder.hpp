#pragma once
#include <ballot/schema/primitives.hpp>
#include <optional>
#include <span>

namespace ballot::schema::encoding {

// Encoding backend is a build time choice selected by tag; hot swapping is not
// supported.
template <typename Library>
struct encoder {
  template <typename T>
  ballot::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, ballot::schema::bytes_t& out);

  template <typename T>
  T decode(const ballot::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const ballot::schema::bytes_view_t& bytes);
};

}  // namespace ballot::schema::encoding
