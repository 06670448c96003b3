#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file bitstream_scan.h
 * \brief Unit scanners for Annex-B (H.264/H.265) and AV1 low-overhead
 * bitstreams.
 *
 * Scanners do not allocate: they write unit references into a caller-provided
 * span and report how many were found.
 */

namespace tagprobe {

/// Scanner result status.
enum class BitstreamScanStatus : uint8_t {
    Ok,
    /// Output span was too small; \ref BitstreamScanResult::needed reports the
    /// required size.
    OutputTruncated,
    /// The bytes do not start like the bitstream format handled by the scanner.
    Unsupported,
    /// A unit is cut off or inconsistent; units before it were reported.
    Malformed,
    /// `max_units` was reached.
    LimitExceeded,
};

/// One Annex-B NAL unit.
struct AnnexBUnitRef final {
    /// Offset of the first NAL header byte (after the start code).
    uint64_t offset = 0;
    /// NAL unit size without the start code and trailing zero bytes.
    uint64_t size = 0;
    /// 3 or 4.
    uint8_t start_code_size = 0;
};

/// One AV1 OBU.
struct Av1ObuRef final {
    uint64_t offset = 0;
    /// Header plus payload.
    uint64_t size        = 0;
    uint32_t header_size = 0;
    uint8_t obu_type     = 0;
};

struct BitstreamScanLimits final {
    uint32_t max_units = 1U << 20;
};

struct BitstreamScanOptions final {
    BitstreamScanLimits limits;
};

struct BitstreamScanResult final {
    BitstreamScanStatus status = BitstreamScanStatus::Ok;
    uint32_t written           = 0;
    uint32_t needed            = 0;
};

/**
 * \brief Splits an Annex-B byte stream at its start codes.
 *
 * The stream must begin with a start code (`00 00 01` or `00 00 00 01`).
 * Empty units are skipped.
 */
BitstreamScanResult
scan_annexb_units(std::span<const std::byte> bytes,
                  std::span<AnnexBUnitRef> out,
                  const BitstreamScanOptions& options
                  = BitstreamScanOptions {}) noexcept;

/**
 * \brief Walks an AV1 low-overhead bitstream (OBUs with size fields).
 *
 * An OBU without a size field extends to the end of the buffer and ends the
 * walk.
 */
BitstreamScanResult
scan_av1_obus(std::span<const std::byte> bytes, std::span<Av1ObuRef> out,
              const BitstreamScanOptions& options
              = BitstreamScanOptions {}) noexcept;

const char*
bitstream_scan_status_name(BitstreamScanStatus status) noexcept;

}  // namespace tagprobe
