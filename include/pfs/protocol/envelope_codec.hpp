#pragma once

#include "pfs/core/failures.hpp"
#include "pfs/core/result.hpp"
#include "wire/envelope.pb.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pfs::protocol {

/**
 * Wire forms of a RatchetEnvelope.
 *
 * JSON uses protobuf's canonical mapping: lowerCamelCase keys, bytes as base64, counters
 * always present. Unknown keys and malformed base64 are rejected with Decode.
 */
class EnvelopeCodec {
public:
    static Result<std::string, ProtocolFailure> ToJson(const proto::wire::RatchetEnvelope& envelope);

    static Result<proto::wire::RatchetEnvelope, ProtocolFailure> FromJson(std::string_view json);

    static Result<std::vector<uint8_t>, ProtocolFailure> ToBytes(const proto::wire::RatchetEnvelope& envelope);

    static Result<proto::wire::RatchetEnvelope, ProtocolFailure> FromBytes(std::span<const uint8_t> bytes);

private:
    EnvelopeCodec() = delete;
};

}
