#include <gtest/gtest.h>

#include "artifact.h"
#include "test_helpers.h"

TEST(Artifact, PathIsKeyPlusTtf) {
    EXPECT_EQ(artifact_filename("myfont"), "myfont.ttf");
    EXPECT_EQ(artifact_path("outputs", "my font"), fs::path("outputs") / "my font.ttf");
}

TEST(Artifact, ServingNamesAreHiddenAndUnique) {
    fs::path a = serving_path("outputs", "myfont");
    fs::path b = serving_path("outputs", "myfont");

    EXPECT_EQ(a.parent_path(), fs::path("outputs"));
    EXPECT_EQ(a.filename().string().rfind(".myfont.", 0), 0u);
    EXPECT_NE(a, b);
    EXPECT_TRUE(is_serving_file(a));
    EXPECT_FALSE(is_serving_file(artifact_path("outputs", "myfont")));
    EXPECT_FALSE(is_serving_file("outputs/.serving"));
    EXPECT_FALSE(is_serving_file("outputs/x.serving"));
}

TEST(Artifact, UrlsPercentEncodeTheKey) {
    EXPECT_EQ(artifact_page_url("myfont"), "/font/myfont");
    EXPECT_EQ(artifact_page_url("my font"), "/font/my%20font");
    EXPECT_EQ(artifact_file_url("my_font-2"), "/font/my_font-2/file");
    EXPECT_EQ(artifact_page_url("\xE5\xAD\x97"), "/font/%E5%AD%97");
}

TEST(Artifact, ContentDisposition) {
    EXPECT_EQ(artifact_content_disposition("my font"), "attachment; filename=\"my font.ttf\"");
    EXPECT_EQ(artifact_content_disposition("Caf\xC3\xA9"),
              "attachment; filename=\"font.ttf\"; filename*=UTF-8''Caf%C3%A9%2Ettf");
}

TEST(ScopedFileTest, RemovesFileWhenDestroyed) {
    TempDir dir;
    fs::path p = dir / "input.png";
    write_file(p, "data");

    {
        ScopedFile guard(p);
        EXPECT_TRUE(fs::exists(p));
    }
    EXPECT_FALSE(fs::exists(p));
}

TEST(ScopedFileTest, ReleaseKeepsFile) {
    TempDir dir;
    fs::path p = dir / "input.png";
    write_file(p, "data");

    {
        ScopedFile guard(p);
        EXPECT_EQ(guard.release(), p);
        EXPECT_TRUE(guard.path().empty());
    }
    EXPECT_TRUE(fs::exists(p));
}

TEST(ScopedFileTest, MovedFromGuardDoesNothing) {
    TempDir dir;
    fs::path p = dir / "input.png";
    write_file(p, "data");

    ScopedFile outer;
    {
        ScopedFile inner(p);
        outer = std::move(inner);
    }
    EXPECT_TRUE(fs::exists(p));

    outer.reset();
    EXPECT_FALSE(fs::exists(p));
    outer.reset();
}

TEST(ScopedFileTest, ToleratesAlreadyMissingFile) {
    TempDir dir;
    ScopedFile guard(dir / "never-created.png");
    guard.reset();
    EXPECT_TRUE(guard.path().empty());
}

TEST(Common, IsWithinDir) {
    TempDir dir;
    EXPECT_TRUE(is_within_dir(dir / "a.ttf", dir.path()));
    EXPECT_TRUE(is_within_dir(dir.path() / "sub" / ".." / "a.ttf", dir.path()));
    EXPECT_FALSE(is_within_dir(dir.path() / ".." / "a.ttf", dir.path()));
    EXPECT_FALSE(is_within_dir(dir.path(), dir.path()));
}

TEST(Common, FindExecutable) {
    EXPECT_EQ(find_executable("/bin/sh"), "/bin/sh");
    EXPECT_FALSE(find_executable("sh").empty());
    EXPECT_TRUE(find_executable("handfont-definitely-not-installed").empty());
    EXPECT_TRUE(find_executable("").empty());
}

TEST(Common, HtmlEscape) {
    EXPECT_EQ(html_escape("<b>\"a\" & 'b'</b>"), "&lt;b&gt;&quot;a&quot; &amp; &#39;b&#39;&lt;/b&gt;");
}
