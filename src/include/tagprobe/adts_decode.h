#pragma once

#include "tagprobe/decode_result.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file adts_decode.h
 * \brief Decoder for AAC ADTS frame headers and a frame-walking scanner.
 */

namespace tagprobe {

inline constexpr uint32_t kAdtsHeaderSize    = 7;
inline constexpr uint32_t kAdtsCrcHeaderSize = 9;
/// PCM samples carried by one raw data block.
inline constexpr uint32_t kAdtsSamplesPerBlock = 1024;

/**
 * \brief Fields of one ADTS header.
 *
 * Field widths follow ISO/IEC 13818-7. \ref sample_rate is 0 when the
 * sampling-frequency index is reserved. \ref channel_count is 0 when the
 * channel configuration is signalled in-band.
 */
struct AdtsHeader final {
    uint64_t offset = 0;

    /// 0 = MPEG-4, 1 = MPEG-2.
    uint8_t id    = 0;
    uint8_t layer = 0;
    bool protection_absent = true;
    /// Profile field (audio object type minus one).
    uint8_t profile           = 0;
    uint8_t audio_object_type = 0;
    uint8_t sampling_frequency_index = 0;
    uint32_t sample_rate             = 0;
    bool private_bit                 = false;
    uint8_t channel_configuration    = 0;
    uint8_t channel_count            = 0;
    bool original_copy               = false;
    bool home                        = false;
    bool copyright_id_bit            = false;
    bool copyright_id_start          = false;
    /// Whole frame length including the header.
    uint16_t frame_length    = 0;
    uint16_t buffer_fullness = 0;
    /// Buffer fullness 0x7FF signals variable bitrate.
    bool vbr = false;
    /// Raw data blocks in the frame (field value plus one).
    uint8_t raw_data_blocks = 1;

    bool has_crc = false;
    uint16_t crc = 0;
    uint32_t header_size = kAdtsHeaderSize;
};

using AdtsDecodeResult = DecodeResult<AdtsHeader>;

struct AdtsScanLimits final {
    uint32_t max_frames = 1U << 20;
};

struct AdtsScanOptions final {
    AdtsScanLimits limits;
};

/// Summary of consecutive ADTS frames.
struct AdtsStreamInfo final {
    /// Header of the first frame.
    AdtsHeader first;
    uint64_t frame_count   = 0;
    uint64_t total_samples = 0;
    /// Bytes covered by complete frames.
    uint64_t stream_bytes     = 0;
    double duration_seconds   = 0.0;
    double average_bitrate    = 0.0;
    /// True when every frame has the first frame's rate and channels.
    bool constant_configuration = true;
};

using AdtsScanResult = DecodeResult<AdtsStreamInfo>;

/// Returns true if \p bytes hold at least 7 bytes starting with sync 0xFFF.
bool
detect_adts_header(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Decodes the ADTS header at the start of \p bytes.
 *
 * A non-zero layer, a reserved sampling-frequency index and a frame length
 * shorter than the header are anomalies. A 9-byte header is read when
 * protection is present; if only 7 bytes are available the CRC is reported
 * as truncated.
 */
AdtsDecodeResult
decode_adts_header(std::span<const std::byte> bytes);

/**
 * \brief Walks ADTS frames from the start of \p bytes by frame length.
 *
 * Stops at the end of the buffer, at a sync loss (anomaly), at a truncated
 * frame (anomaly) or when `max_frames` is reached (anomaly).
 */
AdtsScanResult
scan_adts_stream(std::span<const std::byte> bytes,
                 const AdtsScanOptions& options = AdtsScanOptions {});

/// Sample rate for a sampling-frequency index, 0 for reserved indices.
uint32_t
adts_sample_rate(uint8_t sampling_frequency_index) noexcept;

/// Name of an MPEG-4 audio object type in the ADTS profile range.
const char*
adts_profile_name(uint8_t profile) noexcept;

}  // namespace tagprobe
