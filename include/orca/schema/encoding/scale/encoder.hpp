#pragma once
#include <orca/common/critical.hpp>
#include <orca/schema/encoding/encoder.hpp>
#include <orca/schema/signing_envelope.hpp>
#include <orca/schema/signing_session.hpp>

#include <scale/scale.hpp>

#include <exception>
#include <iterator>

// SCALE backend for engine-private records. Aggregates are encoded field by
// field in declaration order, so adding a field means bumping the record's
// version template argument.
namespace orca::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  orca::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, orca::schema::bytes_t& out);

  template <typename T>
  T decode(const orca::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const orca::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const orca::schema::bytes_view_t& bytes,
                              std::string& error);
};

template <typename T>
orca::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    orca::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        orca::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const orca::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    orca::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const orca::schema::bytes_view_t& bytes) {
  auto error = std::string{};
  return try_decode<T>(bytes, error);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const orca::schema::bytes_view_t& bytes,
    std::string& error) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      error = decoded.error().message();
      return std::nullopt;
    }
    return decoded.value();
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

}  // namespace orca::schema::encoding
