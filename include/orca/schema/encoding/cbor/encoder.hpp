#pragma once
#include <orca/common/critical.hpp>
#include <orca/schema/encoding/cbor/action_request.hpp>
#include <orca/schema/encoding/cbor/oracle_state.hpp>
#include <orca/schema/encoding/cbor/reader.hpp>
#include <orca/schema/encoding/cbor/transaction.hpp>
#include <orca/schema/encoding/cbor/value.hpp>
#include <orca/schema/encoding/cbor/writer.hpp>
#include <orca/schema/encoding/encoder.hpp>

#include <spdlog/spdlog.h>

#include <iterator>

namespace orca::schema::encoding {

struct cbor_encoder_tag {};

template <>
struct encoder<cbor_encoder_tag> final {
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
orca::schema::bytes_t encoder<cbor_encoder_tag>::encode(const T& obj) {
  auto out = cbor::writer{};
  cbor::encode(obj, out);
  return out.release();
}

template <typename T>
void encoder<cbor_encoder_tag>::encode(const T& obj,
                                       orca::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<cbor_encoder_tag>::decode(const orca::schema::bytes_view_t& bytes) {
  auto error = std::string{};
  auto decoded = try_decode<T>(bytes, error);
  if (!decoded) {
    spdlog::error("CBOR decode failed: {}", error);
    orca::common::critical("failed to decode CBOR bytes");
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<cbor_encoder_tag>::try_decode(
    const orca::schema::bytes_view_t& bytes) {
  auto error = std::string{};
  return try_decode<T>(bytes, error);
}

template <typename T>
std::optional<T> encoder<cbor_encoder_tag>::try_decode(
    const orca::schema::bytes_view_t& bytes,
    std::string& error) {
  try {
    auto in = cbor::reader{bytes};
    auto obj = T{};
    cbor::decode(obj, in);
    in.expect_end();
    return obj;
  } catch (const cbor::decode_error& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

}  // namespace orca::schema::encoding
