#include "tagprobe/hevc_nal_decode.h"

#include "tagprobe/byte_reader.h"

#include <array>

namespace tagprobe {
namespace {

    // H.265 Table 7-1.
    static constexpr std::array<std::string_view, 64> kTypeNames = {
        "TRAIL_N",        "TRAIL_R",        "TSA_N",          "TSA_R",
        "STSA_N",         "STSA_R",         "RADL_N",         "RADL_R",
        "RASL_N",         "RASL_R",         "RSV_VCL_N10",    "RSV_VCL_R11",
        "RSV_VCL_N12",    "RSV_VCL_R13",    "RSV_VCL_N14",    "RSV_VCL_R15",
        "BLA_W_LP",       "BLA_W_RADL",     "BLA_N_LP",       "IDR_W_RADL",
        "IDR_N_LP",       "CRA_NUT",        "RSV_IRAP_VCL22", "RSV_IRAP_VCL23",
        "RSV_VCL24",      "RSV_VCL25",      "RSV_VCL26",      "RSV_VCL27",
        "RSV_VCL28",      "RSV_VCL29",      "RSV_VCL30",      "RSV_VCL31",
        "VPS_NUT",        "SPS_NUT",        "PPS_NUT",        "AUD_NUT",
        "EOS_NUT",        "EOB_NUT",        "FD_NUT",         "PREFIX_SEI_NUT",
        "SUFFIX_SEI_NUT", "RSV_NVCL41",     "RSV_NVCL42",     "RSV_NVCL43",
        "RSV_NVCL44",     "RSV_NVCL45",     "RSV_NVCL46",     "RSV_NVCL47",
        "UNSPEC48",       "UNSPEC49",       "UNSPEC50",       "UNSPEC51",
        "UNSPEC52",       "UNSPEC53",       "UNSPEC54",       "UNSPEC55",
        "UNSPEC56",       "UNSPEC57",       "UNSPEC58",       "UNSPEC59",
        "UNSPEC60",       "UNSPEC61",       "UNSPEC62",       "UNSPEC63",
    };

}  // namespace

bool
detect_hevc_nal_header(std::span<const std::byte> bytes) noexcept
{
    uint16_t v = 0;
    if (!read_u16(bytes, 0, Endian::Big, &v)) {
        return false;
    }
    return (v & 0x8000U) == 0 && (v & 0x0007U) != 0;
}


HevcNalDecodeResult
decode_hevc_nal_header(std::span<const std::byte> bytes)
{
    HevcNalDecodeResult result;
    uint16_t v = 0;
    if (!read_u16(bytes, 0, Endian::Big, &v)) {
        result.status = DecodeStatus::NotThisFormat;
        return result;
    }

    HevcNalHeader& h        = result.record;
    h.forbidden_zero_bit    = (v & 0x8000U) != 0;
    h.nal_unit_type         = static_cast<uint8_t>((v >> 9) & 0x3FU);
    h.nuh_layer_id          = static_cast<uint8_t>((v >> 3) & 0x3FU);
    h.nuh_temporal_id_plus1 = static_cast<uint8_t>(v & 0x07U);
    h.temporal_id = h.nuh_temporal_id_plus1 != 0
                        ? static_cast<uint8_t>(h.nuh_temporal_id_plus1 - 1U)
                        : 0;
    h.type_name = hevc_nal_type_name(h.nal_unit_type);
    h.is_vcl    = hevc_is_vcl(h.nal_unit_type);
    h.is_irap   = hevc_is_irap(h.nal_unit_type);

    if (h.forbidden_zero_bit) {
        add_anomaly(&result, AnomalyKind::MalformedStructure, 0,
                    "forbidden_zero_bit is set");
    }
    if (h.nuh_temporal_id_plus1 == 0) {
        add_anomaly(&result, AnomalyKind::MalformedStructure, 1,
                    "nuh_temporal_id_plus1 is 0");
    }
    return result;
}


std::string_view
hevc_nal_type_name(uint8_t nal_unit_type) noexcept
{
    if (nal_unit_type >= kTypeNames.size()) {
        return {};
    }
    return kTypeNames[nal_unit_type];
}


bool
hevc_is_vcl(uint8_t nal_unit_type) noexcept
{
    return nal_unit_type < 32;
}


bool
hevc_is_irap(uint8_t nal_unit_type) noexcept
{
    return nal_unit_type >= 16 && nal_unit_type <= 23;
}

}  // namespace tagprobe
