#include "openklv/build_info.h"
#include "openklv/klv.h"

#include <gtest/gtest.h>

#include <string>

namespace openklv {

TEST(BuildInfoTest, ReportsLinkedLibrary)
{
    const BuildInfo& bi = build_info();
    EXPECT_FALSE(bi.version.empty());
    EXPECT_EQ(bi.linkage, BuildLinkage::Static);
    EXPECT_EQ(bi.strict_encoding, EncodingPolicy {}.strict);
    EXPECT_EQ(bi.max_value_bytes, KlvDecodeLimits {}.max_value_bytes);

    std::string line1;
    std::string line2;
    format_build_info_lines(&line1, &line2);
    EXPECT_EQ(line1.rfind("OpenKLV v", 0), 0U);
    EXPECT_NE(line1.find(std::string(bi.version)), std::string::npos);
    EXPECT_NE(line1.find(" static strict max-value=67108864"),
              std::string::npos);
    EXPECT_EQ(line2.rfind("built with ", 0), 0U);
}


TEST(BuildInfoTest, FormatsCustomInfo)
{
    BuildInfo bi;
    bi.version              = "1.2.3";
    bi.build_type           = "Release";
    bi.system_name          = "Linux";
    bi.system_processor     = "x86_64";
    bi.cxx_compiler_id      = "GNU";
    bi.cxx_compiler_version = "12.2.0";
    bi.linkage              = BuildLinkage::Shared;
    bi.strict_encoding      = false;
    bi.max_value_bytes      = 0;

    std::string line1 = "stale";
    std::string line2;
    format_build_info_lines(bi, &line1, &line2);
    EXPECT_EQ(line1, "OpenKLV v1.2.3 Release shared relaxed max-value=unlimited");
    EXPECT_EQ(line2, "built with GNU-12.2.0 for Linux/x86_64");
}


TEST(BuildInfoTest, LinkageNames)
{
    EXPECT_STREQ(build_linkage_name(BuildLinkage::Static), "static");
    EXPECT_STREQ(build_linkage_name(BuildLinkage::Shared), "shared");
    EXPECT_STREQ(build_linkage_name(BuildLinkage::Unknown), "unknown");
}

}  // namespace openklv
