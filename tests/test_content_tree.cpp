#include <gtest/gtest.h>

#include "hotupdate/content_tree.hpp"
#include "testing.hpp"

namespace hotupdate {
namespace {

TEST(ContentTreeTest, FindsTopLevelWww) {
    testutil::TemporaryDirectory tmp;
    testutil::MakeContentDir(tmp.Path() + "/www", "top");
    EXPECT_EQ(FindContentFolder(tmp.Path()), tmp.Path() + "/www");
}

TEST(ContentTreeTest, FindsWwwOneLevelDown) {
    testutil::TemporaryDirectory tmp;
    testutil::MakeContentDir(tmp.Path() + "/release-2.0/www", "nested");
    EXPECT_EQ(FindContentFolder(tmp.Path()), tmp.Path() + "/release-2.0/www");
}

TEST(ContentTreeTest, DoesNotSearchDeeper) {
    testutil::TemporaryDirectory tmp;
    testutil::MakeContentDir(tmp.Path() + "/a/b/www", "deep");
    EXPECT_EQ(FindContentFolder(tmp.Path()), "");
}

TEST(ContentTreeTest, VerifyRequiresEntryFile) {
    testutil::TemporaryDirectory tmp;
    const std::string dir = tmp.Path() + "/root";
    EXPECT_FALSE(VerifyContentRoot(dir, "index.html").is_ok());

    ASSERT_TRUE(testutil::WriteTextFile(dir + "/main.js", "x"));
    auto r = VerifyContentRoot(dir, "index.html");
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.code, ErrorCode::ExtractionFailed);

    ASSERT_TRUE(testutil::WriteTextFile(dir + "/index.html", "<html></html>"));
    EXPECT_TRUE(VerifyContentRoot(dir, "index.html").is_ok());
}

TEST(ContentTreeTest, VersionMarkerRoundTrip) {
    testutil::TemporaryDirectory tmp;
    EXPECT_FALSE(ReadVersionMarker(tmp.Path()).has_value());
    ASSERT_TRUE(WriteVersionMarker(tmp.Path(), "3.1.4").is_ok());
    EXPECT_EQ(ReadVersionMarker(tmp.Path()), "3.1.4");
}

} // namespace
} // namespace hotupdate
