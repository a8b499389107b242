#pragma once
#include <orca/schema/action_request.hpp>
#include <orca/schema/encoding/cbor/reader.hpp>
#include <orca/schema/encoding/cbor/writer.hpp>

namespace orca::schema::encoding::cbor {

/// Redeemer form of an action: constructor index = variant index.
void encode(const action_payload_t& o, writer& out);
void decode(action_payload_t& o, reader& in);

}  // namespace orca::schema::encoding::cbor
