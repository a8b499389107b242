#pragma once
#include <orca/schema/encoding/cbor/reader.hpp>
#include <orca/schema/encoding/cbor/writer.hpp>
#include <orca/schema/value.hpp>

namespace orca::schema::encoding::cbor {

void encode(const value_t& o, writer& out);
void decode(value_t& o, reader& in);

void encode(const mint_t& o, writer& out);
void decode(mint_t& o, reader& in);

}  // namespace orca::schema::encoding::cbor
