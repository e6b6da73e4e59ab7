#include "pfs/protocol/envelope_codec.hpp"
#include "pfs/core/format.hpp"

#include <google/protobuf/util/json_util.h>

#include <limits>

namespace pfs::protocol {
    using proto::wire::RatchetEnvelope;

    Result<std::string, ProtocolFailure> EnvelopeCodec::ToJson(const RatchetEnvelope& envelope) {
        google::protobuf::util::JsonPrintOptions options;
        options.always_print_primitive_fields = true;
        options.preserve_proto_field_names = false;

        std::string json;
        const auto status = google::protobuf::util::MessageToJsonString(envelope, &json, options);
        if (!status.ok()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Encode(compat::format("Envelope JSON encoding failed: {}", status.ToString())));
        }
        return Result<std::string, ProtocolFailure>::Ok(std::move(json));
    }

    Result<RatchetEnvelope, ProtocolFailure> EnvelopeCodec::FromJson(const std::string_view json) {
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = false;

        RatchetEnvelope envelope;
        const auto status = google::protobuf::util::JsonStringToMessage(
            std::string(json), &envelope, options);
        if (!status.ok()) {
            return Result<RatchetEnvelope, ProtocolFailure>::Err(
                ProtocolFailure::Decode(compat::format("Envelope JSON is malformed: {}", status.ToString())));
        }
        return Result<RatchetEnvelope, ProtocolFailure>::Ok(std::move(envelope));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> EnvelopeCodec::ToBytes(const RatchetEnvelope& envelope) {
        std::string output;
        if (!envelope.SerializeToString(&output)) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Failed to serialize envelope"));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
            std::vector<uint8_t>(output.begin(), output.end()));
    }

    Result<RatchetEnvelope, ProtocolFailure> EnvelopeCodec::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            return Result<RatchetEnvelope, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Envelope too large"));
        }
        RatchetEnvelope envelope;
        if (!envelope.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<RatchetEnvelope, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Failed to parse envelope"));
        }
        return Result<RatchetEnvelope, ProtocolFailure>::Ok(std::move(envelope));
    }

}  // namespace pfs::protocol
