#pragma once
#include <registrar/schema/primitives.hpp>
#include <optional>
#include <span>

namespace registrar::schema::encoding {

// The codec is a build-time choice selected by tag, the same way the storage
// backend is. Values written to the account collection go through it.
template <typename Library>
struct encoder {
  template <typename T>
  registrar::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const registrar::schema::bytes_view_t& bytes);
};

}  // namespace registrar::schema::encoding
