#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

/**
 * \file decode_result.h
 * \brief Tagged decode outcome shared by all TagProbe decoders.
 */

namespace tagprobe {

/// Overall outcome of a decode call.
enum class DecodeStatus : uint8_t {
    /// The record is complete and no anomaly was recorded.
    Ok,
    /// The bytes are not this format (magic/sync mismatch or too short).
    NotThisFormat,
    /// The format was recognized but some structure was abandoned.
    Partial,
};

/// Kind of a non-fatal deviation found while decoding a recognized format.
enum class AnomalyKind : uint8_t {
    /// A declared offset or size points past the end of the buffer.
    OutOfBounds,
    /// Fields are internally inconsistent (bad id, bad count, bad flags).
    MalformedStructure,
    /// The buffer ends in the middle of a structure.
    TruncatedInput,
    /// A resource limit from the decoder options stopped decoding.
    LimitExceeded,
};

/**
 * \brief One recorded anomaly.
 *
 * \p offset is relative to the start of the buffer passed to the decoder.
 * \p detail points at a static string and is never null.
 */
struct Anomaly final {
    AnomalyKind kind = AnomalyKind::MalformedStructure;
    uint64_t offset  = 0;
    std::string_view detail;
};

/**
 * \brief A typed record plus its decode status and anomalies.
 *
 * When \ref status is \ref DecodeStatus::NotThisFormat the record is
 * value-initialized (zero for scalar records) and carries no information.
 */
template <typename Record>
struct DecodeResult final {
    DecodeStatus status = DecodeStatus::Ok;
    Record record {};
    std::vector<Anomaly> anomalies;

    /// True unless the bytes were rejected as not this format.
    bool recognized() const noexcept
    {
        return status != DecodeStatus::NotThisFormat;
    }
};

/// Records an anomaly and downgrades an `Ok` status to `Partial`.
template <typename Record>
void
add_anomaly(DecodeResult<Record>* result, AnomalyKind kind, uint64_t offset,
            std::string_view detail)
{
    if (!result) {
        return;
    }
    result->anomalies.push_back(Anomaly { kind, offset, detail });
    if (result->status == DecodeStatus::Ok) {
        result->status = DecodeStatus::Partial;
    }
}

/// Returns true if any recorded anomaly has \p kind.
bool
has_anomaly(const std::vector<Anomaly>& anomalies, AnomalyKind kind) noexcept;

/// Stable lowercase name, e.g. "not_this_format".
const char*
decode_status_name(DecodeStatus status) noexcept;

/// Stable lowercase name, e.g. "out_of_bounds".
const char*
anomaly_kind_name(AnomalyKind kind) noexcept;

}  // namespace tagprobe
