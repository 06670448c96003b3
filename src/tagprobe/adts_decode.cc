#include "tagprobe/adts_decode.h"

#include "tagprobe/byte_reader.h"

#include <array>

namespace tagprobe {
namespace {

    static constexpr std::array<uint32_t, 13> kSampleRates = {
        96000, 88200, 64000, 48000, 44100, 32000, 24000,
        22050, 16000, 12000, 11025, 8000,  7350,
    };

    static constexpr uint64_t kSyncWord = 0xFFFU;

    static uint32_t bits(uint64_t acc, uint32_t shift, uint32_t width) noexcept
    {
        return static_cast<uint32_t>((acc >> shift)
                                     & ((uint64_t { 1 } << width) - 1U));
    }


    static bool has_sync(std::span<const std::byte> bytes,
                         uint64_t offset) noexcept
    {
        uint16_t v = 0;
        if (!read_u16(bytes, offset, Endian::Big, &v)) {
            return false;
        }
        return (v >> 4) == kSyncWord;
    }


    static uint8_t channels_for_config(uint8_t config) noexcept
    {
        if (config == 7) {
            return 8;
        }
        return config;
    }


    // `bytes` starts at the frame; `base` is its offset in the caller buffer.
    static AdtsDecodeResult decode_at(std::span<const std::byte> bytes,
                                      uint64_t base)
    {
        AdtsDecodeResult result;
        uint64_t acc = 0;
        if (bytes.size() < kAdtsHeaderSize
            || !read_uint_be(bytes, 0, kAdtsHeaderSize, &acc)
            || bits(acc, 44, 12) != kSyncWord) {
            result.status = DecodeStatus::NotThisFormat;
            return result;
        }

        AdtsHeader& h             = result.record;
        h.offset                  = base;
        h.id                      = static_cast<uint8_t>(bits(acc, 43, 1));
        h.layer                   = static_cast<uint8_t>(bits(acc, 41, 2));
        h.protection_absent       = bits(acc, 40, 1) != 0;
        h.profile                 = static_cast<uint8_t>(bits(acc, 38, 2));
        h.audio_object_type       = static_cast<uint8_t>(h.profile + 1U);
        h.sampling_frequency_index = static_cast<uint8_t>(bits(acc, 34, 4));
        h.private_bit             = bits(acc, 33, 1) != 0;
        h.channel_configuration   = static_cast<uint8_t>(bits(acc, 30, 3));
        h.original_copy           = bits(acc, 29, 1) != 0;
        h.home                    = bits(acc, 28, 1) != 0;
        h.copyright_id_bit        = bits(acc, 27, 1) != 0;
        h.copyright_id_start      = bits(acc, 26, 1) != 0;
        h.frame_length            = static_cast<uint16_t>(bits(acc, 13, 13));
        h.buffer_fullness         = static_cast<uint16_t>(bits(acc, 2, 11));
        h.raw_data_blocks         = static_cast<uint8_t>(bits(acc, 0, 2) + 1U);

        h.sample_rate   = adts_sample_rate(h.sampling_frequency_index);
        h.channel_count = channels_for_config(h.channel_configuration);
        h.vbr           = h.buffer_fullness == 0x7FFU;

        if (h.layer != 0) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, base + 1,
                        "layer is not 0");
        }
        if (h.sample_rate == 0) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, base + 2,
                        "sampling-frequency index is reserved");
        }

        if (!h.protection_absent) {
            h.header_size = kAdtsCrcHeaderSize;
            if (read_u16(bytes, kAdtsHeaderSize, Endian::Big, &h.crc)) {
                h.has_crc = true;
            } else {
                add_anomaly(&result, AnomalyKind::TruncatedInput,
                            base + kAdtsHeaderSize, "CRC is cut off");
            }
        }
        if (h.frame_length < h.header_size) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, base + 3,
                        "frame length is shorter than the header");
        }
        return result;
    }

}  // namespace

bool
detect_adts_header(std::span<const std::byte> bytes) noexcept
{
    return bytes.size() >= kAdtsHeaderSize && has_sync(bytes, 0);
}


AdtsDecodeResult
decode_adts_header(std::span<const std::byte> bytes)
{
    return decode_at(bytes, 0);
}


AdtsScanResult
scan_adts_stream(std::span<const std::byte> bytes,
                 const AdtsScanOptions& options)
{
    AdtsScanResult result;
    if (!detect_adts_header(bytes)) {
        result.status = DecodeStatus::NotThisFormat;
        return result;
    }

    AdtsStreamInfo& info = result.record;
    uint64_t pos         = 0;
    while (pos < bytes.size()) {
        if (info.frame_count >= options.limits.max_frames) {
            add_anomaly(&result, AnomalyKind::LimitExceeded, pos,
                        "frame count exceeds max_frames");
            break;
        }

        const AdtsDecodeResult frame
            = decode_at(bytes.subspan(static_cast<size_t>(pos)), pos);
        if (!frame.recognized()) {
            if (bytes.size() - pos < kAdtsHeaderSize && has_sync(bytes, pos)) {
                add_anomaly(&result, AnomalyKind::TruncatedInput, pos,
                            "frame header is cut off");
            } else {
                add_anomaly(&result, AnomalyKind::MalformedStructure, pos,
                            "sync word lost between frames");
            }
            break;
        }
        const AdtsHeader& h = frame.record;
        if (info.frame_count == 0) {
            info.first = h;
            for (size_t i = 0; i < frame.anomalies.size(); ++i) {
                result.anomalies.push_back(frame.anomalies[i]);
                result.status = DecodeStatus::Partial;
            }
        } else if (h.sample_rate != info.first.sample_rate
                   || h.channel_configuration
                          != info.first.channel_configuration) {
            info.constant_configuration = false;
        }

        if (h.frame_length < h.header_size) {
            if (info.frame_count != 0) {
                add_anomaly(&result, AnomalyKind::MalformedStructure, pos + 3,
                            "frame length is shorter than the header");
            }
            break;
        }
        if (h.frame_length > bytes.size() - pos) {
            add_anomaly(&result, AnomalyKind::TruncatedInput, pos,
                        "frame extends past the buffer");
            break;
        }

        info.frame_count += 1;
        info.total_samples += static_cast<uint64_t>(h.raw_data_blocks)
                              * kAdtsSamplesPerBlock;
        info.stream_bytes += h.frame_length;
        pos += h.frame_length;
    }

    if (info.first.sample_rate != 0) {
        info.duration_seconds = static_cast<double>(info.total_samples)
                                / static_cast<double>(info.first.sample_rate);
    }
    if (info.duration_seconds > 0.0) {
        info.average_bitrate = static_cast<double>(info.stream_bytes) * 8.0
                               / info.duration_seconds;
    }
    return result;
}


uint32_t
adts_sample_rate(uint8_t sampling_frequency_index) noexcept
{
    if (sampling_frequency_index >= kSampleRates.size()) {
        return 0;
    }
    return kSampleRates[sampling_frequency_index];
}


const char*
adts_profile_name(uint8_t profile) noexcept
{
    switch (profile) {
    case 0: return "AAC Main";
    case 1: return "AAC LC";
    case 2: return "AAC SSR";
    case 3: return "AAC LTP";
    default: return "unknown";
    }
}

}  // namespace tagprobe
