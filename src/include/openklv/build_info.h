#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Version, toolchain and decode defaults of the linked OpenKLV build.
 */

namespace openklv {

/// Which library target the binary was linked against.
enum class BuildLinkage : uint8_t {
    Unknown,
    Static,
    Shared,
};

/// Returns "static", "shared" or "unknown".
const char*
build_linkage_name(BuildLinkage linkage) noexcept;

/**
 * \brief Configure-time facts about an OpenKLV build.
 *
 * Toolchain fields come from the CMake-generated header. The decode defaults
 * mirror `EncodingPolicy {}` and `KlvDecodeLimits {}` as compiled into the
 * library, so a dump header shows how untrusted input is treated when no
 * options are given.
 */
struct BuildInfo final {
    std::string_view version;
    /// ISO-8601 UTC configure time, or empty.
    std::string_view build_timestamp_utc;
    std::string_view build_type;
    std::string_view system_name;
    std::string_view system_processor;
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;
    BuildLinkage linkage = BuildLinkage::Unknown;

    /// Default of \ref EncodingPolicy::strict.
    bool strict_encoding = true;
    /// Default of \ref KlvDecodeLimits::max_value_bytes (0 = unlimited).
    uint64_t max_value_bytes = 0;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats the two-line header printed by the tools.
 *
 * - `OpenKLV vX.Y.Z <build_type> <linkage> <strict|relaxed> max-value=<N>`
 * - `built with <compiler>-<version> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2);

void
format_build_info_lines(std::string* line1, std::string* line2);

}  // namespace openklv
