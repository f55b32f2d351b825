#pragma once
#include <swapguard/schema/primitives.hpp>
#include <optional>
#include <span>

namespace swapguard::schema::encoding {

// Library selection is a build-time choice: each backend specializes this
// template on its own tag type.
template <typename Library>
struct encoder {
  template <typename T>
  swapguard::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, swapguard::schema::bytes_t& out);

  template <typename T>
  T decode(const swapguard::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const swapguard::schema::bytes_view_t& bytes);
};

}  // namespace swapguard::schema::encoding
