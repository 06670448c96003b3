#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how TagProbe was built.
 */

namespace tagprobe {

/// Configure-time facts about the TagProbe library this binary links.
struct BuildInfo final {
    /// Project version from CMake (e.g. "0.3.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// CMake generator used to configure the build (e.g. "Ninja").
    std::string_view cmake_generator;

    /// Target platform (e.g. "Linux", "Darwin", "Windows").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;
    std::string_view cxx_compiler;

    /// Exactly one of these is set, following `BUILD_SHARED_LIBS`.
    bool linkage_static = false;
    bool linkage_shared = false;

    /// Whether zlib was requested at configure time (`TAGPROBE_WITH_ZLIB`).
    bool option_with_zlib = false;
    /// zlib was found and linked; compressed ID3v2 frames are inflated.
    bool has_zlib = false;
};

/// Returns build information for the linked TagProbe library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `TagProbe vX.Y.Z <build_type> [features] <linkage>`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Same as above for \ref build_info().
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace tagprobe
