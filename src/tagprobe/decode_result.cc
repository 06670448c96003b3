#include "tagprobe/decode_result.h"

namespace tagprobe {

bool
has_anomaly(const std::vector<Anomaly>& anomalies, AnomalyKind kind) noexcept
{
    for (size_t i = 0; i < anomalies.size(); ++i) {
        if (anomalies[i].kind == kind) {
            return true;
        }
    }
    return false;
}


const char*
decode_status_name(DecodeStatus status) noexcept
{
    switch (status) {
    case DecodeStatus::Ok: return "ok";
    case DecodeStatus::NotThisFormat: return "not_this_format";
    case DecodeStatus::Partial: return "partial";
    }
    return "unknown";
}


const char*
anomaly_kind_name(AnomalyKind kind) noexcept
{
    switch (kind) {
    case AnomalyKind::OutOfBounds: return "out_of_bounds";
    case AnomalyKind::MalformedStructure: return "malformed_structure";
    case AnomalyKind::TruncatedInput: return "truncated_input";
    case AnomalyKind::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace tagprobe
