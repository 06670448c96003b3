#include "tagprobe/build_info.h"

#include "tagprobe/build_info_generated.h"

#include <string>

namespace tagprobe {
namespace {

    static constexpr bool linkage_static() noexcept
    {
#if defined(TAGPROBE_BUILD_LINKAGE_STATIC) && TAGPROBE_BUILD_LINKAGE_STATIC
        return true;
#else
        return false;
#endif
    }

    static constexpr bool linkage_shared() noexcept
    {
#if defined(TAGPROBE_BUILD_LINKAGE_SHARED) && TAGPROBE_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static constexpr bool has_zlib() noexcept
    {
#if defined(TAGPROBE_HAS_ZLIB) && TAGPROBE_HAS_ZLIB
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/TAGPROBE_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/TAGPROBE_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/TAGPROBE_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/TAGPROBE_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/TAGPROBE_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/TAGPROBE_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/TAGPROBE_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/TAGPROBE_BUILDINFO_CXX_COMPILER_VERSION,
        /*cxx_compiler=*/TAGPROBE_BUILDINFO_CXX_COMPILER,
        /*linkage_static=*/linkage_static(),
        /*linkage_shared=*/linkage_shared(),
        /*option_with_zlib=*/static_cast<bool>(TAGPROBE_BUILDINFO_WITH_ZLIB),
        /*has_zlib=*/has_zlib(),
    };

    static const char* linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->reserve(128);
        line1->append("TagProbe v");
        line1->append(bi.version);
        line1->append(" ");
        line1->append(bi.build_type);
        line1->append(" [");
        if (bi.has_zlib) {
            line1->append("zlib");
        }
        line1->append("] ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->clear();
        line2->reserve(160);
        line2->append("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->append("-");
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->append("/");
        line2->append(bi.system_processor);

        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace tagprobe
