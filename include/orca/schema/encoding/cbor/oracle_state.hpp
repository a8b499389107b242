#pragma once
#include <orca/schema/encoding/cbor/reader.hpp>
#include <orca/schema/encoding/cbor/writer.hpp>
#include <orca/schema/oracle_state.hpp>

namespace orca::schema::encoding::cbor {

void encode(const price_data_t& o, writer& out);
void decode(price_data_t& o, reader& in);

void encode(const node_entry_t& o, writer& out);
void decode(node_entry_t& o, reader& in);

void encode(const oracle_settings_t& o, writer& out);
void decode(oracle_settings_t& o, reader& in);

void encode(const oracle_state_t& o, writer& out);
void decode(oracle_state_t& o, reader& in);

}  // namespace orca::schema::encoding::cbor
