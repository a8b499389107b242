#pragma once
#include <orca/schema/encoding/cbor/reader.hpp>
#include <orca/schema/encoding/cbor/writer.hpp>
#include <orca/schema/transaction.hpp>
#include <orca/schema/utxo.hpp>

#include <vector>

namespace orca::schema::encoding::cbor {

void encode(const key_hash_t& o, writer& out);
void decode(key_hash_t& o, reader& in);

void encode(const bytes_t& o, writer& out);
void decode(bytes_t& o, reader& in);

void encode(const vkey_witness_t& o, writer& out);
void decode(vkey_witness_t& o, reader& in);

void encode(const redeemer_t& o, writer& out);
void decode(redeemer_t& o, reader& in);

void encode(const output_reference_t& o, writer& out);
void decode(output_reference_t& o, reader& in);

void encode(const transaction_output_t& o, writer& out);
void decode(transaction_output_t& o, reader& in);

void encode(const std::vector<redeemer_t>& o, writer& out);
void decode(std::vector<redeemer_t>& o, reader& in);

void encode(const witness_set_t& o, writer& out);
void decode(witness_set_t& o, reader& in);

void encode(const transaction_body_t& o, writer& out);
void decode(transaction_body_t& o, reader& in);

void encode(const transaction_t& o, writer& out);
void decode(transaction_t& o, reader& in);

}  // namespace orca::schema::encoding::cbor
