#include <gtest/gtest.h>
#include <web_tiles/platform/library_info.h>

namespace web_tiles::tests {

TEST(LibraryInfoTest, VersionIsSemantic) {
    const std::string version = LibraryInfo::GetVersion();
    EXPECT_EQ(version, "0.1.0");
}

TEST(LibraryInfoTest, BuildInfoNamesVersionAndTransport) {
    const std::string info = LibraryInfo::GetBuildInfo();
    EXPECT_NE(info.find(LibraryInfo::GetVersion()), std::string::npos);
    EXPECT_NE(info.find("libcurl"), std::string::npos);
}

TEST(LibraryInfoTest, TransportSupportsHttp) {
    EXPECT_TRUE(LibraryInfo::CheckSystemRequirements());
}

} // namespace web_tiles::tests
