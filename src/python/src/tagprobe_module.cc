#include "tagprobe/adts_decode.h"
#include "tagprobe/ape_tag_decode.h"
#include "tagprobe/av1_obu_decode.h"
#include "tagprobe/avc_nal_decode.h"
#include "tagprobe/bext_decode.h"
#include "tagprobe/bitstream_scan.h"
#include "tagprobe/build_info.h"
#include "tagprobe/console_format.h"
#include "tagprobe/hevc_nal_decode.h"
#include "tagprobe/icc_decode.h"
#include "tagprobe/id3v1_decode.h"
#include "tagprobe/id3v2_decode.h"
#include "tagprobe/resource_policy.h"
#include "tagprobe/text_decode.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/array.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <cstdio>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace tagprobe {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static nb::bytes bytes_to_py(std::span<const std::byte> bytes)
    {
        return nb::bytes(reinterpret_cast<const char*>(bytes.data()),
                         bytes.size());
    }


    static std::span<const std::byte> py_to_span(const nb::bytes& data)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.data()), data.size());
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static TagProbeResourcePolicy policy_from_python(const nb::object& obj)
    {
        if (obj.is_none()) {
            return TagProbeResourcePolicy {};
        }
        return nb::cast<TagProbeResourcePolicy>(obj);
    }


    static nb::bytes read_file(const std::string& path,
                               uint64_t max_file_bytes)
    {
        if (path.empty()) {
            throw std::runtime_error("empty path");
        }

        std::vector<std::byte> bytes;
        const char* error = nullptr;
        {
            nb::gil_scoped_release gil_release;
            std::FILE* f = std::fopen(path.c_str(), "rb");
            if (!f) {
                error = "failed to open file";
            } else {
                long size_long = -1;
                if (std::fseek(f, 0, SEEK_END) != 0) {
                    error = "failed to seek file";
                } else if ((size_long = std::ftell(f)) < 0) {
                    error = "failed to stat file";
                } else if (max_file_bytes != 0U
                           && static_cast<uint64_t>(size_long)
                                  > max_file_bytes) {
                    error = "file too large";
                } else if (std::fseek(f, 0, SEEK_SET) != 0) {
                    error = "failed to rewind file";
                } else {
                    bytes.resize(static_cast<size_t>(size_long));
                    const size_t n = std::fread(bytes.data(), 1, bytes.size(),
                                                f);
                    if (n != bytes.size()) {
                        error = "failed to read file";
                    }
                }
                std::fclose(f);
            }
        }
        if (error) {
            throw std::runtime_error(error);
        }
        return bytes_to_py(bytes);
    }


    // Runs a decoder over the bytes of a Python object with the GIL
    // released. The caller keeps `data` alive for the duration.
    template <typename Fn>
    static auto decode_released(const nb::bytes& data, Fn&& fn)
    {
        const std::span<const std::byte> bytes = py_to_span(data);
        nb::gil_scoped_release gil_release;
        return fn(bytes);
    }


    template <typename Record>
    static void bind_result(nb::module_& m, const char* name)
    {
        using Result = DecodeResult<Record>;
        nb::class_<Result>(m, name)
            .def_ro("status", &Result::status)
            .def_ro("record", &Result::record)
            .def_ro("anomalies", &Result::anomalies)
            .def_prop_ro("recognized",
                         [](const Result& r) { return r.recognized(); })
            .def("__repr__", [name](const Result& r) {
                std::string s(name);
                s.append("(status=");
                s.append(decode_status_name(r.status));
                s.append(", anomalies=");
                s.append(std::to_string(r.anomalies.size()));
                s.append(")");
                return s;
            });
    }

}  // namespace
}  // namespace tagprobe

NB_MODULE(tagprobe, m)
{
    using namespace tagprobe;

    m.doc()               = "TagProbe binary tag and header decoders (nanobind).";
    m.attr("__version__") = sv_to_py(build_info().version);

    nb::enum_<DecodeStatus>(m, "DecodeStatus")
        .value("Ok", DecodeStatus::Ok)
        .value("NotThisFormat", DecodeStatus::NotThisFormat)
        .value("Partial", DecodeStatus::Partial);

    nb::enum_<AnomalyKind>(m, "AnomalyKind")
        .value("OutOfBounds", AnomalyKind::OutOfBounds)
        .value("MalformedStructure", AnomalyKind::MalformedStructure)
        .value("TruncatedInput", AnomalyKind::TruncatedInput)
        .value("LimitExceeded", AnomalyKind::LimitExceeded);

    nb::enum_<TextEncoding>(m, "TextEncoding")
        .value("Latin1", TextEncoding::Latin1)
        .value("Utf16Bom", TextEncoding::Utf16Bom)
        .value("Utf16BE", TextEncoding::Utf16BE)
        .value("Utf16LE", TextEncoding::Utf16LE)
        .value("Utf8", TextEncoding::Utf8)
        .value("Ascii", TextEncoding::Ascii);

    nb::enum_<Id3v2FrameKind>(m, "Id3v2FrameKind")
        .value("Text", Id3v2FrameKind::Text)
        .value("UserText", Id3v2FrameKind::UserText)
        .value("Url", Id3v2FrameKind::Url)
        .value("UserUrl", Id3v2FrameKind::UserUrl)
        .value("Comment", Id3v2FrameKind::Comment)
        .value("Picture", Id3v2FrameKind::Picture)
        .value("Binary", Id3v2FrameKind::Binary);

    nb::enum_<ApeItemKind>(m, "ApeItemKind")
        .value("Text", ApeItemKind::Text)
        .value("Binary", ApeItemKind::Binary)
        .value("External", ApeItemKind::External)
        .value("Reserved", ApeItemKind::Reserved);

    nb::enum_<ApeTagPosition>(m, "ApeTagPosition")
        .value("Start", ApeTagPosition::Start)
        .value("End", ApeTagPosition::End)
        .value("BeforeId3v1", ApeTagPosition::BeforeId3v1);

    nb::enum_<IccTagType>(m, "IccTagType")
        .value("Desc", IccTagType::Desc)
        .value("Text", IccTagType::Text)
        .value("Mluc", IccTagType::Mluc)
        .value("Xyz", IccTagType::Xyz)
        .value("Sf32", IccTagType::Sf32)
        .value("Uf32", IccTagType::Uf32)
        .value("Ui08", IccTagType::Ui08)
        .value("Ui16", IccTagType::Ui16)
        .value("Ui32", IccTagType::Ui32)
        .value("Ui64", IccTagType::Ui64)
        .value("Curv", IccTagType::Curv)
        .value("Para", IccTagType::Para)
        .value("Sig", IccTagType::Sig)
        .value("Opaque", IccTagType::Opaque);

    nb::enum_<BitstreamScanStatus>(m, "BitstreamScanStatus")
        .value("Ok", BitstreamScanStatus::Ok)
        .value("OutputTruncated", BitstreamScanStatus::OutputTruncated)
        .value("Unsupported", BitstreamScanStatus::Unsupported)
        .value("Malformed", BitstreamScanStatus::Malformed)
        .value("LimitExceeded", BitstreamScanStatus::LimitExceeded);

    nb::class_<Anomaly>(m, "Anomaly")
        .def_ro("kind", &Anomaly::kind)
        .def_ro("offset", &Anomaly::offset)
        .def_prop_ro("detail",
                     [](const Anomaly& a) { return std::string(a.detail); })
        .def("__repr__", [](const Anomaly& a) {
            std::string s("Anomaly(kind=");
            s.append(anomaly_kind_name(a.kind));
            s.append(", offset=");
            s.append(std::to_string(a.offset));
            s.append(", detail=");
            s.append(a.detail);
            s.append(")");
            return s;
        });

    // Limits and policy.
    nb::class_<Id3v2DecodeLimits>(m, "Id3v2DecodeLimits")
        .def(nb::init<>())
        .def_rw("max_frames", &Id3v2DecodeLimits::max_frames)
        .def_rw("max_frame_bytes", &Id3v2DecodeLimits::max_frame_bytes)
        .def_rw("max_inflated_bytes", &Id3v2DecodeLimits::max_inflated_bytes)
        .def_rw("max_total_frame_bytes",
                &Id3v2DecodeLimits::max_total_frame_bytes);

    nb::class_<ApeTagDecodeLimits>(m, "ApeTagDecodeLimits")
        .def(nb::init<>())
        .def_rw("max_items", &ApeTagDecodeLimits::max_items)
        .def_rw("max_item_bytes", &ApeTagDecodeLimits::max_item_bytes);

    nb::class_<IccDecodeLimits>(m, "IccDecodeLimits")
        .def(nb::init<>())
        .def_rw("max_tags", &IccDecodeLimits::max_tags)
        .def_rw("max_tag_bytes", &IccDecodeLimits::max_tag_bytes)
        .def_rw("max_total_tag_bytes", &IccDecodeLimits::max_total_tag_bytes);

    nb::class_<AdtsScanLimits>(m, "AdtsScanLimits")
        .def(nb::init<>())
        .def_rw("max_frames", &AdtsScanLimits::max_frames);

    nb::class_<BitstreamScanLimits>(m, "BitstreamScanLimits")
        .def(nb::init<>())
        .def_rw("max_units", &BitstreamScanLimits::max_units);

    nb::class_<TagProbeResourcePolicy>(m, "ResourcePolicy")
        .def(nb::init<>())
        .def_rw("max_file_bytes", &TagProbeResourcePolicy::max_file_bytes)
        .def_rw("id3v2_limits", &TagProbeResourcePolicy::id3v2_limits)
        .def_rw("ape_limits", &TagProbeResourcePolicy::ape_limits)
        .def_rw("icc_limits", &TagProbeResourcePolicy::icc_limits)
        .def_rw("adts_scan_limits", &TagProbeResourcePolicy::adts_scan_limits)
        .def_rw("bitstream_limits",
                &TagProbeResourcePolicy::bitstream_limits);

    // ID3v1
    nb::class_<Id3v1Tag>(m, "Id3v1Tag")
        .def_ro("offset", &Id3v1Tag::offset)
        .def_ro("title", &Id3v1Tag::title)
        .def_ro("artist", &Id3v1Tag::artist)
        .def_ro("album", &Id3v1Tag::album)
        .def_ro("year", &Id3v1Tag::year)
        .def_ro("comment", &Id3v1Tag::comment)
        .def_ro("is_v1_1", &Id3v1Tag::is_v1_1)
        .def_ro("track", &Id3v1Tag::track)
        .def_ro("genre", &Id3v1Tag::genre)
        .def_prop_ro("genre_name", [](const Id3v1Tag& t) {
            return std::string(t.genre_name);
        });
    bind_result<Id3v1Tag>(m, "Id3v1DecodeResult");

    // ID3v2
    nb::class_<Id3v2Header>(m, "Id3v2Header")
        .def_ro("major_version", &Id3v2Header::major_version)
        .def_ro("revision", &Id3v2Header::revision)
        .def_ro("flags", &Id3v2Header::flags)
        .def_ro("tag_size", &Id3v2Header::tag_size)
        .def_ro("unsynchronisation", &Id3v2Header::unsynchronisation)
        .def_ro("extended_header", &Id3v2Header::extended_header)
        .def_ro("experimental", &Id3v2Header::experimental)
        .def_ro("footer", &Id3v2Header::footer)
        .def_ro("extended_header_size", &Id3v2Header::extended_header_size);

    nb::class_<Id3v2Frame>(m, "Id3v2Frame")
        .def_ro("id", &Id3v2Frame::id)
        .def_ro("offset", &Id3v2Frame::offset)
        .def_ro("declared_size", &Id3v2Frame::declared_size)
        .def_ro("flags", &Id3v2Frame::flags)
        .def_ro("compressed", &Id3v2Frame::compressed)
        .def_ro("encrypted", &Id3v2Frame::encrypted)
        .def_ro("unsynchronised", &Id3v2Frame::unsynchronised)
        .def_ro("grouped", &Id3v2Frame::grouped)
        .def_ro("group_id", &Id3v2Frame::group_id)
        .def_ro("encryption_id", &Id3v2Frame::encryption_id)
        .def_ro("data_length", &Id3v2Frame::data_length)
        .def_prop_ro("payload",
                     [](const Id3v2Frame& f) { return bytes_to_py(f.payload); })
        .def_ro("kind", &Id3v2Frame::kind)
        .def_ro("encoding", &Id3v2Frame::encoding)
        .def_ro("values", &Id3v2Frame::values)
        .def_ro("description", &Id3v2Frame::description)
        .def_ro("language", &Id3v2Frame::language)
        .def_ro("mime_type", &Id3v2Frame::mime_type)
        .def_ro("picture_type", &Id3v2Frame::picture_type)
        .def_prop_ro("picture", [](const Id3v2Frame& f) {
            return bytes_to_py(id3v2_picture_bytes(f));
        });

    nb::class_<Id3v2Tag>(m, "Id3v2Tag")
        .def_ro("header", &Id3v2Tag::header)
        .def_ro("frames", &Id3v2Tag::frames)
        .def_ro("padding_size", &Id3v2Tag::padding_size)
        .def_ro("tag_end", &Id3v2Tag::tag_end);
    bind_result<Id3v2Tag>(m, "Id3v2DecodeResult");

    // APE
    nb::class_<ApeTagBlock>(m, "ApeTagBlock")
        .def_ro("version", &ApeTagBlock::version)
        .def_ro("tag_size", &ApeTagBlock::tag_size)
        .def_ro("item_count", &ApeTagBlock::item_count)
        .def_ro("flags", &ApeTagBlock::flags)
        .def_ro("has_header", &ApeTagBlock::has_header)
        .def_ro("has_footer", &ApeTagBlock::has_footer)
        .def_ro("read_only", &ApeTagBlock::read_only);

    nb::class_<ApeItem>(m, "ApeItem")
        .def_ro("key", &ApeItem::key)
        .def_ro("offset", &ApeItem::offset)
        .def_ro("flags", &ApeItem::flags)
        .def_ro("kind", &ApeItem::kind)
        .def_ro("read_only", &ApeItem::read_only)
        .def_prop_ro("value",
                     [](const ApeItem& i) { return bytes_to_py(i.value); })
        .def_ro("values", &ApeItem::values);

    nb::class_<ApeTag>(m, "ApeTag")
        .def_ro("block", &ApeTag::block)
        .def_ro("position", &ApeTag::position)
        .def_ro("tag_offset", &ApeTag::tag_offset)
        .def_ro("tag_end", &ApeTag::tag_end)
        .def_ro("items", &ApeTag::items);
    bind_result<ApeTag>(m, "ApeTagDecodeResult");

    // BWF bext
    nb::class_<BextChunk>(m, "BextChunk")
        .def_ro("offset", &BextChunk::offset)
        .def_ro("declared_size", &BextChunk::declared_size)
        .def_ro("description", &BextChunk::description)
        .def_ro("originator", &BextChunk::originator)
        .def_ro("originator_reference", &BextChunk::originator_reference)
        .def_ro("origination_date", &BextChunk::origination_date)
        .def_ro("origination_time", &BextChunk::origination_time)
        .def_ro("time_reference", &BextChunk::time_reference)
        .def_ro("version", &BextChunk::version)
        .def_ro("has_umid", &BextChunk::has_umid)
        .def_ro("umid", &BextChunk::umid)
        .def_ro("has_loudness", &BextChunk::has_loudness)
        .def_prop_ro("loudness_value",
                     [](const BextChunk& b) {
                         return bext_loudness_to_double(b.loudness_value);
                     })
        .def_prop_ro("loudness_range",
                     [](const BextChunk& b) {
                         return bext_loudness_to_double(b.loudness_range);
                     })
        .def_prop_ro("max_true_peak_level",
                     [](const BextChunk& b) {
                         return bext_loudness_to_double(b.max_true_peak_level);
                     })
        .def_prop_ro("max_momentary_loudness",
                     [](const BextChunk& b) {
                         return bext_loudness_to_double(
                             b.max_momentary_loudness);
                     })
        .def_prop_ro("max_short_term_loudness",
                     [](const BextChunk& b) {
                         return bext_loudness_to_double(
                             b.max_short_term_loudness);
                     })
        .def_ro("coding_history", &BextChunk::coding_history);
    bind_result<BextChunk>(m, "BextDecodeResult");

    // ADTS
    nb::class_<AdtsHeader>(m, "AdtsHeader")
        .def_ro("offset", &AdtsHeader::offset)
        .def_ro("id", &AdtsHeader::id)
        .def_ro("layer", &AdtsHeader::layer)
        .def_ro("protection_absent", &AdtsHeader::protection_absent)
        .def_ro("profile", &AdtsHeader::profile)
        .def_ro("audio_object_type", &AdtsHeader::audio_object_type)
        .def_ro("sampling_frequency_index",
                &AdtsHeader::sampling_frequency_index)
        .def_ro("sample_rate", &AdtsHeader::sample_rate)
        .def_ro("channel_configuration", &AdtsHeader::channel_configuration)
        .def_ro("channel_count", &AdtsHeader::channel_count)
        .def_ro("frame_length", &AdtsHeader::frame_length)
        .def_ro("buffer_fullness", &AdtsHeader::buffer_fullness)
        .def_ro("vbr", &AdtsHeader::vbr)
        .def_ro("raw_data_blocks", &AdtsHeader::raw_data_blocks)
        .def_ro("has_crc", &AdtsHeader::has_crc)
        .def_ro("crc", &AdtsHeader::crc)
        .def_ro("header_size", &AdtsHeader::header_size);
    bind_result<AdtsHeader>(m, "AdtsDecodeResult");

    nb::class_<AdtsStreamInfo>(m, "AdtsStreamInfo")
        .def_ro("first", &AdtsStreamInfo::first)
        .def_ro("frame_count", &AdtsStreamInfo::frame_count)
        .def_ro("total_samples", &AdtsStreamInfo::total_samples)
        .def_ro("stream_bytes", &AdtsStreamInfo::stream_bytes)
        .def_ro("duration_seconds", &AdtsStreamInfo::duration_seconds)
        .def_ro("average_bitrate", &AdtsStreamInfo::average_bitrate)
        .def_ro("constant_configuration",
                &AdtsStreamInfo::constant_configuration);
    bind_result<AdtsStreamInfo>(m, "AdtsScanResult");

    // ICC
    nb::class_<IccXyz>(m, "IccXyz")
        .def_ro("x", &IccXyz::x)
        .def_ro("y", &IccXyz::y)
        .def_ro("z", &IccXyz::z);

    nb::class_<IccDateTime>(m, "IccDateTime")
        .def_ro("year", &IccDateTime::year)
        .def_ro("month", &IccDateTime::month)
        .def_ro("day", &IccDateTime::day)
        .def_ro("hour", &IccDateTime::hour)
        .def_ro("minute", &IccDateTime::minute)
        .def_ro("second", &IccDateTime::second);

    nb::class_<IccHeader>(m, "IccHeader")
        .def_ro("declared_size", &IccHeader::declared_size)
        .def_ro("cmm", &IccHeader::cmm_sig)
        .def_ro("version_major", &IccHeader::version_major)
        .def_ro("version_minor", &IccHeader::version_minor)
        .def_ro("version_bugfix", &IccHeader::version_bugfix)
        .def_ro("device_class", &IccHeader::device_class_sig)
        .def_ro("color_space", &IccHeader::color_space_sig)
        .def_ro("connection_space", &IccHeader::connection_space_sig)
        .def_ro("created", &IccHeader::created)
        .def_ro("platform", &IccHeader::platform_sig)
        .def_ro("flags", &IccHeader::flags)
        .def_ro("manufacturer", &IccHeader::manufacturer_sig)
        .def_ro("model", &IccHeader::model)
        .def_ro("attributes", &IccHeader::attributes)
        .def_ro("rendering_intent", &IccHeader::rendering_intent)
        .def_ro("illuminant", &IccHeader::illuminant)
        .def_ro("creator", &IccHeader::creator_sig)
        .def_ro("profile_id", &IccHeader::profile_id)
        .def_prop_ro("device_class_name",
                     [](const IccHeader& h) {
                         return std::string(
                             icc_device_class_name(h.device_class));
                     })
        .def_prop_ro("color_space_name", [](const IccHeader& h) {
            return std::string(icc_color_space_name(h.color_space));
        });

    nb::class_<IccTagEntry>(m, "IccTagEntry")
        .def_ro("signature", &IccTagEntry::signature_sig)
        .def_ro("offset", &IccTagEntry::offset)
        .def_ro("size", &IccTagEntry::size)
        .def_ro("in_bounds", &IccTagEntry::in_bounds);

    nb::class_<IccLocalizedString>(m, "IccLocalizedString")
        .def_ro("language", &IccLocalizedString::language)
        .def_ro("country", &IccLocalizedString::country)
        .def_ro("text", &IccLocalizedString::text);

    nb::class_<IccTag>(m, "IccTag")
        .def_ro("signature", &IccTag::signature_sig)
        .def_ro("type_signature", &IccTag::type_sig)
        .def_ro("type", &IccTag::type)
        .def_ro("offset", &IccTag::offset)
        .def_ro("size", &IccTag::size)
        .def_ro("text", &IccTag::text)
        .def_ro("localized", &IccTag::localized)
        .def_ro("numbers", &IccTag::numbers)
        .def_ro("integers", &IccTag::integers)
        .def_ro("function_type", &IccTag::function_type);

    nb::class_<IccProfile>(m, "IccProfile")
        .def_ro("header", &IccProfile::header)
        .def_ro("tag_table", &IccProfile::tag_table)
        .def_ro("tags", &IccProfile::tags);
    bind_result<IccProfile>(m, "IccDecodeResult");

    // Video unit headers
    nb::class_<AvcNalHeader>(m, "AvcNalHeader")
        .def_ro("forbidden_zero_bit", &AvcNalHeader::forbidden_zero_bit)
        .def_ro("nal_ref_idc", &AvcNalHeader::nal_ref_idc)
        .def_ro("nal_unit_type", &AvcNalHeader::nal_unit_type)
        .def_prop_ro("type_name",
                     [](const AvcNalHeader& h) {
                         return std::string(h.type_name);
                     })
        .def_ro("has_profile_level", &AvcNalHeader::has_profile_level)
        .def_ro("profile_idc", &AvcNalHeader::profile_idc)
        .def_ro("constraint_flags", &AvcNalHeader::constraint_flags)
        .def_ro("level_idc", &AvcNalHeader::level_idc)
        .def_prop_ro("profile_name",
                     [](const AvcNalHeader& h) {
                         return std::string(h.profile_name);
                     })
        .def_ro("level_name", &AvcNalHeader::level_name);
    bind_result<AvcNalHeader>(m, "AvcNalDecodeResult");

    nb::class_<HevcNalHeader>(m, "HevcNalHeader")
        .def_ro("forbidden_zero_bit", &HevcNalHeader::forbidden_zero_bit)
        .def_ro("nal_unit_type", &HevcNalHeader::nal_unit_type)
        .def_ro("nuh_layer_id", &HevcNalHeader::nuh_layer_id)
        .def_ro("nuh_temporal_id_plus1", &HevcNalHeader::nuh_temporal_id_plus1)
        .def_ro("temporal_id", &HevcNalHeader::temporal_id)
        .def_prop_ro("type_name",
                     [](const HevcNalHeader& h) {
                         return std::string(h.type_name);
                     })
        .def_ro("is_vcl", &HevcNalHeader::is_vcl)
        .def_ro("is_irap", &HevcNalHeader::is_irap);
    bind_result<HevcNalHeader>(m, "HevcNalDecodeResult");

    nb::class_<Av1ObuHeader>(m, "Av1ObuHeader")
        .def_ro("forbidden_bit", &Av1ObuHeader::forbidden_bit)
        .def_ro("obu_type", &Av1ObuHeader::obu_type)
        .def_prop_ro("type_name",
                     [](const Av1ObuHeader& h) {
                         return std::string(h.type_name);
                     })
        .def_ro("extension_flag", &Av1ObuHeader::extension_flag)
        .def_ro("has_size_field", &Av1ObuHeader::has_size_field)
        .def_ro("reserved_bit", &Av1ObuHeader::reserved_bit)
        .def_ro("temporal_id", &Av1ObuHeader::temporal_id)
        .def_ro("spatial_id", &Av1ObuHeader::spatial_id)
        .def_ro("obu_size", &Av1ObuHeader::obu_size)
        .def_ro("header_size", &Av1ObuHeader::header_size);
    bind_result<Av1ObuHeader>(m, "Av1ObuDecodeResult");

    // Detectors take no policy and never release the GIL: they read at most a
    // few fixed offsets.
    m.def("detect_id3v1", [](nb::bytes data) {
        return detect_id3v1(py_to_span(data));
    }, "data"_a);
    m.def("detect_id3v2", [](nb::bytes data) {
        return detect_id3v2(py_to_span(data));
    }, "data"_a);
    m.def("detect_ape_tag", [](nb::bytes data) {
        return detect_ape_tag(py_to_span(data));
    }, "data"_a);
    m.def("detect_bext_chunk", [](nb::bytes data) {
        return detect_bext_chunk(py_to_span(data));
    }, "data"_a);
    m.def("detect_adts_header", [](nb::bytes data) {
        return detect_adts_header(py_to_span(data));
    }, "data"_a);
    m.def("detect_icc_profile", [](nb::bytes data) {
        return detect_icc_profile(py_to_span(data));
    }, "data"_a);
    m.def("detect_avc_nal_header", [](nb::bytes data) {
        return detect_avc_nal_header(py_to_span(data));
    }, "data"_a);
    m.def("detect_hevc_nal_header", [](nb::bytes data) {
        return detect_hevc_nal_header(py_to_span(data));
    }, "data"_a);
    m.def("detect_av1_obu_header", [](nb::bytes data) {
        return detect_av1_obu_header(py_to_span(data));
    }, "data"_a);

    m.def("decode_id3v1", [](nb::bytes data) {
        return decode_released(data, [](std::span<const std::byte> b) {
            return decode_id3v1(b);
        });
    }, "data"_a);

    m.def(
        "decode_id3v2",
        [](nb::bytes data, nb::object policy_obj) {
            const TagProbeResourcePolicy policy = policy_from_python(
                policy_obj);
            Id3v2DecodeOptions options;
            apply_resource_policy(policy, &options, nullptr);
            return decode_released(data,
                                   [&options](std::span<const std::byte> b) {
                                       return decode_id3v2(b, options);
                                   });
        },
        "data"_a, "policy"_a = nb::none());

    m.def(
        "decode_ape_tag",
        [](nb::bytes data, nb::object policy_obj) {
            const TagProbeResourcePolicy policy = policy_from_python(
                policy_obj);
            ApeTagDecodeOptions options;
            apply_resource_policy(policy, nullptr, &options);
            return decode_released(data,
                                   [&options](std::span<const std::byte> b) {
                                       return decode_ape_tag(b, options);
                                   });
        },
        "data"_a, "policy"_a = nb::none());

    m.def("decode_bext_chunk", [](nb::bytes data) {
        return decode_released(data, [](std::span<const std::byte> b) {
            return decode_bext_chunk(b);
        });
    }, "data"_a);

    m.def("decode_bext_in_wave", [](nb::bytes data) {
        return decode_released(data, [](std::span<const std::byte> b) {
            return decode_bext_in_wave(b);
        });
    }, "data"_a);

    m.def("decode_adts_header", [](nb::bytes data) {
        return decode_released(data, [](std::span<const std::byte> b) {
            return decode_adts_header(b);
        });
    }, "data"_a);

    m.def(
        "scan_adts_stream",
        [](nb::bytes data, nb::object policy_obj) {
            const TagProbeResourcePolicy policy = policy_from_python(
                policy_obj);
            AdtsScanOptions options;
            apply_resource_policy(policy, &options, nullptr);
            return decode_released(data,
                                   [&options](std::span<const std::byte> b) {
                                       return scan_adts_stream(b, options);
                                   });
        },
        "data"_a, "policy"_a = nb::none());

    m.def(
        "decode_icc_profile",
        [](nb::bytes data, nb::object policy_obj) {
            const TagProbeResourcePolicy policy = policy_from_python(
                policy_obj);
            IccDecodeOptions options;
            apply_resource_policy(policy, &options);
            return decode_released(data,
                                   [&options](std::span<const std::byte> b) {
                                       return decode_icc_profile(b, options);
                                   });
        },
        "data"_a, "policy"_a = nb::none());

    m.def("decode_avc_nal_header", [](nb::bytes data) {
        return decode_released(data, [](std::span<const std::byte> b) {
            return decode_avc_nal_header(b);
        });
    }, "data"_a);

    m.def("decode_hevc_nal_header", [](nb::bytes data) {
        return decode_released(data, [](std::span<const std::byte> b) {
            return decode_hevc_nal_header(b);
        });
    }, "data"_a);

    m.def("decode_av1_obu_header", [](nb::bytes data) {
        return decode_released(data, [](std::span<const std::byte> b) {
            return decode_av1_obu_header(b);
        });
    }, "data"_a);

    m.def("decode_av1_obu", [](nb::bytes data) {
        return decode_released(data, [](std::span<const std::byte> b) {
            return decode_av1_obu(b);
        });
    }, "data"_a);

    // Returns (status, [(offset, size, start_code_size), ...]).
    m.def(
        "scan_annexb_units",
        [](nb::bytes data, uint32_t max_units) {
            BitstreamScanOptions options;
            options.limits.max_units = max_units;
            std::vector<AnnexBUnitRef> units(64);
            BitstreamScanResult res;
            {
                const std::span<const std::byte> bytes = py_to_span(data);
                nb::gil_scoped_release gil_release;
                for (;;) {
                    res = scan_annexb_units(bytes, units, options);
                    if (res.status == BitstreamScanStatus::OutputTruncated
                        && res.needed > units.size()) {
                        units.resize(res.needed);
                        continue;
                    }
                    break;
                }
            }
            nb::list out;
            for (uint32_t i = 0; i < res.written; ++i) {
                out.append(nb::make_tuple(units[i].offset, units[i].size,
                                          units[i].start_code_size));
            }
            return std::make_pair(res.status, out);
        },
        "data"_a, "max_units"_a = BitstreamScanLimits {}.max_units);

    // Returns (status, [(offset, size, header_size, obu_type), ...]).
    m.def(
        "scan_av1_obus",
        [](nb::bytes data, uint32_t max_units) {
            BitstreamScanOptions options;
            options.limits.max_units = max_units;
            std::vector<Av1ObuRef> obus(64);
            BitstreamScanResult res;
            {
                const std::span<const std::byte> bytes = py_to_span(data);
                nb::gil_scoped_release gil_release;
                for (;;) {
                    res = scan_av1_obus(bytes, obus, options);
                    if (res.status == BitstreamScanStatus::OutputTruncated
                        && res.needed > obus.size()) {
                        obus.resize(res.needed);
                        continue;
                    }
                    break;
                }
            }
            nb::list out;
            for (uint32_t i = 0; i < res.written; ++i) {
                out.append(nb::make_tuple(obus[i].offset, obus[i].size,
                                          obus[i].header_size,
                                          obus[i].obu_type));
            }
            return std::make_pair(res.status, out);
        },
        "data"_a, "max_units"_a = BitstreamScanLimits {}.max_units);

    m.def("read_file", &read_file, "path"_a,
          "max_file_bytes"_a = TagProbeResourcePolicy {}.max_file_bytes);

    m.def(
        "console_text",
        [](const std::string& s, uint32_t max_bytes) {
            std::string out;
            const bool dangerous = append_console_escaped_utf8(s, max_bytes,
                                                               &out);
            return std::make_pair(out, dangerous);
        },
        "text"_a, "max_bytes"_a = 4096U);

    m.def("build_info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]              = sv_to_py(bi.version);
        d["build_timestamp_utc"]  = sv_to_py(bi.build_timestamp_utc);
        d["build_type"]           = sv_to_py(bi.build_type);
        d["cmake_generator"]      = sv_to_py(bi.cmake_generator);
        d["system_name"]          = sv_to_py(bi.system_name);
        d["system_processor"]     = sv_to_py(bi.system_processor);
        d["cxx_compiler_id"]      = sv_to_py(bi.cxx_compiler_id);
        d["cxx_compiler_version"] = sv_to_py(bi.cxx_compiler_version);
        d["cxx_compiler"]         = sv_to_py(bi.cxx_compiler);
        d["linkage_static"]       = nb::bool_(bi.linkage_static);
        d["linkage_shared"]       = nb::bool_(bi.linkage_shared);
        d["option_with_zlib"]     = nb::bool_(bi.option_with_zlib);
        d["has_zlib"]             = nb::bool_(bi.has_zlib);
        return d;
    });

    m.def("info_lines", &info_lines);

    m.def("id3v1_genre_name", [](uint8_t genre) -> nb::object {
        const std::string_view n = id3v1_genre_name(genre);
        if (n.empty()) {
            return nb::none();
        }
        return sv_to_py(n);
    }, "genre"_a);
}
