#include "tagprobe/avc_nal_decode.h"

#include "tagprobe/byte_reader.h"

namespace tagprobe {
namespace {

    static constexpr uint8_t kConstraintSet1 = 0x40;
    static constexpr uint8_t kConstraintSet3 = 0x10;

    static bool is_parameter_set(uint8_t nal_unit_type) noexcept
    {
        return nal_unit_type == kAvcNalSps
               || nal_unit_type == kAvcNalSubsetSps;
    }

}  // namespace

bool
detect_avc_nal_header(std::span<const std::byte> bytes) noexcept
{
    if (bytes.empty()) {
        return false;
    }
    return (static_cast<uint8_t>(bytes[0]) & 0x80U) == 0;
}


AvcNalDecodeResult
decode_avc_nal_header(std::span<const std::byte> bytes)
{
    AvcNalDecodeResult result;
    if (bytes.empty()) {
        result.status = DecodeStatus::NotThisFormat;
        return result;
    }

    AvcNalHeader& h       = result.record;
    const uint8_t b0      = static_cast<uint8_t>(bytes[0]);
    h.forbidden_zero_bit  = (b0 & 0x80U) != 0;
    h.nal_ref_idc         = static_cast<uint8_t>((b0 >> 5) & 0x03U);
    h.nal_unit_type       = static_cast<uint8_t>(b0 & 0x1FU);
    h.type_name           = avc_nal_type_name(h.nal_unit_type);

    if (h.forbidden_zero_bit) {
        add_anomaly(&result, AnomalyKind::MalformedStructure, 0,
                    "forbidden_zero_bit is set");
    }

    if (is_parameter_set(h.nal_unit_type)) {
        if (!read_u8(bytes, 1, &h.profile_idc)
            || !read_u8(bytes, 2, &h.constraint_flags)
            || !read_u8(bytes, 3, &h.level_idc)) {
            h.profile_idc      = 0;
            h.constraint_flags = 0;
            add_anomaly(&result, AnomalyKind::TruncatedInput, 1,
                        "profile and level bytes are cut off");
            return result;
        }
        h.has_profile_level = true;
        h.header_size       = 4;
        h.profile_name = avc_profile_name(h.profile_idc, h.constraint_flags);
        h.level_name   = avc_level_name(h.profile_idc, h.constraint_flags,
                                        h.level_idc);
        if ((h.constraint_flags & 0x03U) != 0) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, 2,
                        "reserved_zero_2bits are set");
        }
    }
    return result;
}


std::string_view
avc_nal_type_name(uint8_t nal_unit_type) noexcept
{
    switch (nal_unit_type) {
    case 0: return "unspecified";
    case 1: return "non-IDR slice";
    case 2: return "slice data partition A";
    case 3: return "slice data partition B";
    case 4: return "slice data partition C";
    case 5: return "IDR slice";
    case 6: return "supplemental enhancement information";
    case 7: return "sequence parameter set";
    case 8: return "picture parameter set";
    case 9: return "access unit delimiter";
    case 10: return "end of sequence";
    case 11: return "end of stream";
    case 12: return "filler data";
    case 13: return "sequence parameter set extension";
    case 14: return "prefix NAL unit";
    case 15: return "subset sequence parameter set";
    case 16: return "depth parameter set";
    case 19: return "auxiliary slice";
    case 20: return "slice extension";
    case 21: return "depth view slice extension";
    default: break;
    }
    return nal_unit_type < 24 ? "reserved" : "unspecified";
}


std::string_view
avc_profile_name(uint8_t profile_idc, uint8_t constraint_flags) noexcept
{
    switch (profile_idc) {
    case 66:
        return (constraint_flags & kConstraintSet1) != 0
                   ? "Constrained Baseline"
                   : "Baseline";
    case 77: return "Main";
    case 88: return "Extended";
    case 100: return "High";
    case 110: return "High 10";
    case 122: return "High 4:2:2";
    case 244: return "High 4:4:4 Predictive";
    case 44: return "CAVLC 4:4:4 Intra";
    case 83: return "Scalable Baseline";
    case 86: return "Scalable High";
    case 118: return "Multiview High";
    case 128: return "Stereo High";
    case 134: return "MFC High";
    case 138: return "Multiview Depth High";
    case 139: return "Enhanced Multiview Depth High";
    default: return "unknown";
    }
}


std::string
avc_level_name(uint8_t profile_idc, uint8_t constraint_flags,
               uint8_t level_idc)
{
    if (level_idc == 9) {
        return "1b";
    }
    if (level_idc == 11 && (constraint_flags & kConstraintSet3) != 0
        && (profile_idc == 66 || profile_idc == 77 || profile_idc == 88)) {
        return "1b";
    }
    std::string s = std::to_string(level_idc / 10);
    if (level_idc % 10 != 0) {
        s.push_back('.');
        s.push_back(static_cast<char>('0' + level_idc % 10));
    }
    return s;
}

}  // namespace tagprobe
