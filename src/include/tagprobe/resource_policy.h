#pragma once

#include "tagprobe/adts_decode.h"
#include "tagprobe/ape_tag_decode.h"
#include "tagprobe/bitstream_scan.h"
#include "tagprobe/icc_decode.h"
#include "tagprobe/id3v2_decode.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource-budget policy for TagProbe read workflows.
 */

namespace tagprobe {

/**
 * \brief Storage-agnostic resource limits for untrusted tag input.
 *
 * Every decoder already carries default limits; the policy gathers them in
 * one place so tools can override them together.
 */
struct TagProbeResourcePolicy final {
    /// Refuse to read files larger than this (0 = unlimited).
    uint64_t max_file_bytes = 512ULL * 1024ULL * 1024ULL;

    Id3v2DecodeLimits id3v2_limits;
    ApeTagDecodeLimits ape_limits;
    IccDecodeLimits icc_limits;
    AdtsScanLimits adts_scan_limits;
    BitstreamScanLimits bitstream_limits;
};

inline void
apply_resource_policy(const TagProbeResourcePolicy& policy,
                      Id3v2DecodeOptions* id3v2,
                      ApeTagDecodeOptions* ape) noexcept
{
    if (id3v2) {
        id3v2->limits = policy.id3v2_limits;
    }
    if (ape) {
        ape->limits = policy.ape_limits;
    }
}

inline void
apply_resource_policy(const TagProbeResourcePolicy& policy,
                      IccDecodeOptions* icc) noexcept
{
    if (icc) {
        icc->limits = policy.icc_limits;
    }
}

inline void
apply_resource_policy(const TagProbeResourcePolicy& policy,
                      AdtsScanOptions* adts,
                      BitstreamScanOptions* bitstream) noexcept
{
    if (adts) {
        adts->limits = policy.adts_scan_limits;
    }
    if (bitstream) {
        bitstream->limits = policy.bitstream_limits;
    }
}

}  // namespace tagprobe
