#include <orca/schema/encoding/cbor/plutus_data.hpp>
#include <orca/schema/encoding/cbor/transaction.hpp>
#include <orca/schema/encoding/cbor/value.hpp>

#include <spdlog/fmt/fmt.h>

#include <limits>

namespace orca::schema::encoding::cbor {

namespace {

inline constexpr uint64_t kEncodedCborTag = 24;
inline constexpr uint64_t kSetTag = 258;
inline constexpr uint64_t kInlineDatum = 1;
inline constexpr uint64_t kPlutusV2Script = 2;

template <typename T>
void encode_list(const std::vector<T>& items, writer& out) {
  out.write_array_header(items.size());
  for (const auto& item : items) {
    encode(item, out);
  }
}

// Set-typed body fields may carry tag 258.
template <typename T>
void decode_list(std::vector<T>& items, reader& in) {
  items.clear();
  if (in.peek_type() == major_type::tag) {
    auto tag = in.read_tag();
    if (tag != kSetTag) {
      throw decode_error{fmt::format("unexpected tag {} on list", tag)};
    }
  }
  auto size = in.read_array_header();
  if (!size) {
    while (!in.next_is_break()) {
      auto item = T{};
      decode(item, in);
      items.push_back(std::move(item));
    }
    in.read_break();
    return;
  }
  for (auto i = uint64_t{0}; i < *size; ++i) {
    auto item = T{};
    decode(item, in);
    items.push_back(std::move(item));
  }
}

template <typename Fn>
void read_map(reader& in, const std::string_view what, Fn&& field) {
  auto size = in.read_map_header();
  if (!size) {
    throw decode_error{fmt::format("{} map must be definite", what)};
  }
  auto previous = std::optional<uint64_t>{};
  for (auto i = uint64_t{0}; i < *size; ++i) {
    auto key = in.read_unsigned();
    if (previous && key <= *previous) {
      throw decode_error{
          fmt::format("{}: duplicate or unordered key {}", what, key)};
    }
    previous = key;
    field(key);
  }
}

}  // namespace

void encode(const key_hash_t& o, writer& out) {
  out.write_bytes(bytes_view_t{o.data(), o.size()});
}

void decode(key_hash_t& o, reader& in) {
  o = read_fixed_bytes<28>(in, "required signer");
}

void encode(const vkey_witness_t& o, writer& out) {
  out.write_array_header(2);
  out.write_bytes(bytes_view_t{o.vkey.data(), o.vkey.size()});
  out.write_bytes(bytes_view_t{o.signature.data(), o.signature.size()});
}

void decode(vkey_witness_t& o, reader& in) {
  auto size = in.read_array_header();
  if (!size || *size != 2) {
    throw decode_error{"vkey witness must be a 2-element array"};
  }
  o.vkey = read_fixed_bytes<32>(in, "vkey");
  o.signature = read_fixed_bytes<64>(in, "signature");
}

void encode(const bytes_t& o, writer& out) {
  out.write_bytes(make_bytes_view(o));
}

void decode(bytes_t& o, reader& in) {
  o = in.read_bytes();
}

void encode(const redeemer_t& o, writer& out) {
  out.write_array_header(4);
  out.write_unsigned(static_cast<uint64_t>(o.tag));
  out.write_unsigned(o.index);
  out.write_raw(make_bytes_view(o.data));
  out.write_array_header(2);
  out.write_unsigned(o.ex_units.memory);
  out.write_unsigned(o.ex_units.steps);
}

void decode(redeemer_t& o, reader& in) {
  auto size = in.read_array_header();
  if (!size || *size != 4) {
    throw decode_error{"redeemer must be a 4-element array"};
  }
  auto tag = in.read_unsigned();
  if (tag > static_cast<uint64_t>(redeemer_tag_t::mint)) {
    throw decode_error{fmt::format("unsupported redeemer tag {}", tag)};
  }
  o.tag = static_cast<redeemer_tag_t>(tag);
  auto index = in.read_unsigned();
  if (index > std::numeric_limits<uint32_t>::max()) {
    throw decode_error{"redeemer index out of range"};
  }
  o.index = static_cast<uint32_t>(index);
  o.data = make_bytes(in.read_raw_item());
  auto units = in.read_array_header();
  if (!units || *units != 2) {
    throw decode_error{"ex units must be a 2-element array"};
  }
  o.ex_units.memory = in.read_unsigned();
  o.ex_units.steps = in.read_unsigned();
}

void encode(const output_reference_t& o, writer& out) {
  out.write_array_header(2);
  out.write_bytes(bytes_view_t{o.tx_id.data(), o.tx_id.size()});
  out.write_unsigned(o.index);
}

void decode(output_reference_t& o, reader& in) {
  auto size = in.read_array_header();
  if (!size || *size != 2) {
    throw decode_error{"output reference must be a 2-element array"};
  }
  o.tx_id = read_fixed_bytes<32>(in, "transaction id");
  auto index = in.read_unsigned();
  if (index > std::numeric_limits<uint32_t>::max()) {
    throw decode_error{"output index out of range"};
  }
  o.index = static_cast<uint32_t>(index);
}

void encode(const transaction_output_t& o, writer& out) {
  auto fields = 2 + (o.datum ? 1 : 0) + (o.reference_script ? 1 : 0);
  out.write_map_header(fields);
  out.write_unsigned(0);
  out.write_bytes(make_bytes_view(o.address));
  out.write_unsigned(1);
  encode(o.value, out);
  if (o.datum) {
    out.write_unsigned(2);
    out.write_array_header(2);
    out.write_unsigned(kInlineDatum);
    out.write_tag(kEncodedCborTag);
    out.write_bytes(make_bytes_view(*o.datum));
  }
  if (o.reference_script) {
    auto script = writer{};
    script.write_array_header(2);
    script.write_unsigned(kPlutusV2Script);
    script.write_bytes(make_bytes_view(*o.reference_script));
    out.write_unsigned(3);
    out.write_tag(kEncodedCborTag);
    out.write_bytes(make_bytes_view(script.bytes()));
  }
}

void decode(transaction_output_t& o, reader& in) {
  o = transaction_output_t{};
  auto has_address = false;
  auto has_value = false;
  read_map(in, "transaction output", [&](const uint64_t key) {
    switch (key) {
      case 0:
        o.address = in.read_bytes();
        has_address = true;
        break;
      case 1:
        decode(o.value, in);
        has_value = true;
        break;
      case 2: {
        auto size = in.read_array_header();
        if (!size || *size != 2 || in.read_unsigned() != kInlineDatum) {
          throw decode_error{"only inline datums are supported"};
        }
        if (in.read_tag() != kEncodedCborTag) {
          throw decode_error{"inline datum must be tag 24"};
        }
        o.datum = in.read_bytes();
        break;
      }
      case 3: {
        if (in.read_tag() != kEncodedCborTag) {
          throw decode_error{"script reference must be tag 24"};
        }
        auto wrapped = in.read_bytes();
        auto script = reader{make_bytes_view(wrapped)};
        auto size = script.read_array_header();
        if (!size || *size != 2 ||
            script.read_unsigned() != kPlutusV2Script) {
          throw decode_error{"only Plutus V2 reference scripts are supported"};
        }
        o.reference_script = script.read_bytes();
        script.expect_end();
        break;
      }
      default:
        throw decode_error{fmt::format("unknown output field {}", key)};
    }
  });
  if (!has_address || !has_value) {
    throw decode_error{"transaction output requires address and value"};
  }
}

void encode(const std::vector<redeemer_t>& o, writer& out) {
  encode_list(o, out);
}

void decode(std::vector<redeemer_t>& o, reader& in) {
  decode_list(o, in);
}

void encode(const witness_set_t& o, writer& out) {
  auto fields = (o.vkey_witnesses.empty() ? 0 : 1) +
                (o.redeemers.empty() ? 0 : 1) +
                (o.plutus_v2_scripts.empty() ? 0 : 1);
  out.write_map_header(fields);
  if (!o.vkey_witnesses.empty()) {
    out.write_unsigned(0);
    encode_list(o.vkey_witnesses, out);
  }
  if (!o.redeemers.empty()) {
    out.write_unsigned(5);
    encode_list(o.redeemers, out);
  }
  if (!o.plutus_v2_scripts.empty()) {
    out.write_unsigned(6);
    encode_list(o.plutus_v2_scripts, out);
  }
}

void decode(witness_set_t& o, reader& in) {
  o = witness_set_t{};
  read_map(in, "witness set", [&](const uint64_t key) {
    switch (key) {
      case 0:
        decode_list(o.vkey_witnesses, in);
        break;
      case 5:
        decode_list(o.redeemers, in);
        break;
      case 6:
        decode_list(o.plutus_v2_scripts, in);
        break;
      default:
        throw decode_error{fmt::format("unsupported witness field {}", key)};
    }
  });
}

void encode(const transaction_body_t& o, writer& out) {
  auto fields = 3 + (o.ttl ? 1 : 0) + (o.validity_start ? 1 : 0) +
                (o.mint.empty() ? 0 : 1) + (o.script_data_hash ? 1 : 0) +
                (o.collateral.empty() ? 0 : 1) +
                (o.required_signers.empty() ? 0 : 1) +
                (o.reference_inputs.empty() ? 0 : 1);
  out.write_map_header(fields);
  out.write_unsigned(0);
  encode_list(o.inputs, out);
  out.write_unsigned(1);
  encode_list(o.outputs, out);
  out.write_unsigned(2);
  out.write_unsigned(o.fee);
  if (o.ttl) {
    out.write_unsigned(3);
    out.write_unsigned(*o.ttl);
  }
  if (o.validity_start) {
    out.write_unsigned(8);
    out.write_unsigned(*o.validity_start);
  }
  if (!o.mint.empty()) {
    out.write_unsigned(9);
    encode(o.mint, out);
  }
  if (o.script_data_hash) {
    out.write_unsigned(11);
    out.write_bytes(
        bytes_view_t{o.script_data_hash->data(), o.script_data_hash->size()});
  }
  if (!o.collateral.empty()) {
    out.write_unsigned(13);
    encode_list(o.collateral, out);
  }
  if (!o.required_signers.empty()) {
    out.write_unsigned(14);
    encode_list(o.required_signers, out);
  }
  if (!o.reference_inputs.empty()) {
    out.write_unsigned(18);
    encode_list(o.reference_inputs, out);
  }
}

void decode(transaction_body_t& o, reader& in) {
  o = transaction_body_t{};
  auto has_inputs = false;
  auto has_outputs = false;
  auto has_fee = false;
  read_map(in, "transaction body", [&](const uint64_t key) {
    switch (key) {
      case 0:
        decode_list(o.inputs, in);
        has_inputs = true;
        break;
      case 1:
        decode_list(o.outputs, in);
        has_outputs = true;
        break;
      case 2:
        o.fee = in.read_unsigned();
        has_fee = true;
        break;
      case 3:
        o.ttl = in.read_unsigned();
        break;
      case 8:
        o.validity_start = in.read_unsigned();
        break;
      case 9:
        decode(o.mint, in);
        break;
      case 11:
        o.script_data_hash = read_fixed_bytes<32>(in, "script data hash");
        break;
      case 13:
        decode_list(o.collateral, in);
        break;
      case 14:
        decode_list(o.required_signers, in);
        break;
      case 18:
        decode_list(o.reference_inputs, in);
        break;
      default:
        throw decode_error{fmt::format("unsupported body field {}", key)};
    }
  });
  if (!has_inputs || !has_outputs || !has_fee) {
    throw decode_error{"transaction body requires inputs, outputs and fee"};
  }
}

void encode(const transaction_t& o, writer& out) {
  out.write_array_header(4);
  encode(o.body, out);
  encode(o.witnesses, out);
  out.write_bool(o.is_valid);
  out.write_null();
}

void decode(transaction_t& o, reader& in) {
  auto size = in.read_array_header();
  if (!size || *size != 4) {
    throw decode_error{"transaction must be a 4-element array"};
  }
  decode(o.body, in);
  decode(o.witnesses, in);
  o.is_valid = in.read_bool();
  in.read_null();
}

}  // namespace orca::schema::encoding::cbor
