#pragma once

#include "tagprobe/decode_result.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

/**
 * \file bext_decode.h
 * \brief Decoder for the Broadcast Wave `bext` chunk (EBU Tech 3285) and a
 * RIFF chunk locator.
 */

namespace tagprobe {

/// Size of the fixed part of the `bext` chunk body.
inline constexpr uint32_t kBextFixedSize = 602;

/// One chunk found by \ref find_riff_chunk.
struct RiffChunkRef final {
    uint32_t id = 0;
    /// Offset of the 8-byte chunk header within the file buffer.
    uint64_t offset = 0;
    /// Declared body size (64-bit for RF64/BW64 `data` via `ds64`).
    uint64_t size = 0;
};

/// Limits for \ref find_riff_chunk.
struct RiffWalkLimits final {
    uint32_t max_chunks = 4096;
};

/**
 * \brief Decoded `bext` chunk.
 *
 * Text fields are right-trimmed and converted from Latin-1 to UTF-8.
 * Loudness values are in 0.01 LU / dB units.
 */
struct BextChunk final {
    /// Offset of the chunk header within the decoded buffer.
    uint64_t offset        = 0;
    uint32_t declared_size = 0;

    std::string description;
    std::string originator;
    std::string originator_reference;
    std::string origination_date;
    std::string origination_time;
    /// Sample count since midnight (both halves reassembled).
    uint64_t time_reference = 0;
    uint16_t version        = 0;

    /// Valid when \ref has_umid (version >= 1).
    bool has_umid = false;
    std::array<uint8_t, 64> umid {};

    /// Valid when \ref has_loudness (version >= 2).
    bool has_loudness               = false;
    int16_t loudness_value          = 0;
    int16_t loudness_range          = 0;
    int16_t max_true_peak_level     = 0;
    int16_t max_momentary_loudness  = 0;
    int16_t max_short_term_loudness = 0;

    std::string coding_history;
};

using BextDecodeResult = DecodeResult<BextChunk>;

/// Returns true if \p bytes start with a `bext` chunk header.
bool
detect_bext_chunk(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Decodes a `bext` chunk starting at its 8-byte header.
 *
 * A declared size past the buffer clamps the coding history and records
 * an `OutOfBounds` anomaly. A declared size under 602 records
 * `TruncatedInput` and leaves the fields that do not fit empty.
 */
BextDecodeResult
decode_bext_chunk(std::span<const std::byte> bytes);

/**
 * \brief Locates the first chunk \p id in a RIFF/RF64/BW64 `WAVE` file.
 *
 * Chunks are word aligned. Returns false if \p bytes is not a WAVE file or
 * the chunk is not found before the walk ends.
 */
bool
find_riff_chunk(std::span<const std::byte> bytes, uint32_t id,
                RiffChunkRef* out,
                const RiffWalkLimits& limits = RiffWalkLimits {}) noexcept;

/// Finds the `bext` chunk in a WAVE file and decodes it. Offsets are
/// relative to the file buffer.
BextDecodeResult
decode_bext_in_wave(std::span<const std::byte> bytes);

/// Converts a loudness field to LU / dB.
double
bext_loudness_to_double(int16_t value) noexcept;

}  // namespace tagprobe
