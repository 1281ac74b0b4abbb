#include "openklv/build_info.h"

#include "openklv/build_info_generated.h"
#include "openklv/klv.h"
#include "openklv/klv_status.h"

#include <cstdio>

namespace openklv {
namespace {

    static constexpr BuildLinkage compiled_linkage() noexcept
    {
#if defined(OPENKLV_BUILD_LINKAGE_SHARED) && OPENKLV_BUILD_LINKAGE_SHARED
        return BuildLinkage::Shared;
#elif defined(OPENKLV_BUILD_LINKAGE_STATIC) && OPENKLV_BUILD_LINKAGE_STATIC
        return BuildLinkage::Static;
#else
        return BuildLinkage::Unknown;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/OPENKLV_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/OPENKLV_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/OPENKLV_BUILDINFO_BUILD_TYPE,
        /*system_name=*/OPENKLV_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/OPENKLV_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/OPENKLV_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/OPENKLV_BUILDINFO_CXX_COMPILER_VERSION,
        /*linkage=*/compiled_linkage(),
        /*strict_encoding=*/EncodingPolicy {}.strict,
        /*max_value_bytes=*/KlvDecodeLimits {}.max_value_bytes,
    };

}  // namespace

const char*
build_linkage_name(BuildLinkage linkage) noexcept
{
    switch (linkage) {
    case BuildLinkage::Unknown: return "unknown";
    case BuildLinkage::Static: return "static";
    case BuildLinkage::Shared: return "shared";
    }
    return "unknown";
}


const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        char limit[48];
        if (bi.max_value_bytes == 0U) {
            std::snprintf(limit, sizeof(limit), "unlimited");
        } else {
            std::snprintf(limit, sizeof(limit), "%llu",
                          static_cast<unsigned long long>(bi.max_value_bytes));
        }

        line1->assign("OpenKLV v");
        line1->append(bi.version);
        line1->push_back(' ');
        line1->append(bi.build_type.empty() ? "unknown" : bi.build_type);
        line1->push_back(' ');
        line1->append(build_linkage_name(bi.linkage));
        line1->append(bi.strict_encoding ? " strict" : " relaxed");
        line1->append(" max-value=");
        line1->append(limit);
    }

    if (line2) {
        line2->assign("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->push_back('-');
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->push_back('/');
        line2->append(bi.system_processor);
        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(bi.build_timestamp_utc);
            line2->push_back(')');
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2)
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace openklv
