#include <gtest/gtest.h>
#include <scriptbox/paths.h>
#include "scriptbox/truncator.h"
#include "utils.h"

TEST(TruncatorTest, KeepsBothEnds) {
  bool truncated;
  std::string preview = MakePreview("1\n2\n3\n4\n5\n6\n", {2, 0}, &truncated);
  EXPECT_TRUE(truncated);
  EXPECT_EQ(preview, "1\n2\n...truncated...\n5\n6");
}

TEST(TruncatorTest, NoTruncationWhenFits) {
  bool truncated;
  EXPECT_EQ(MakePreview("1\n2\n3\n4\n", {2, 100}, &truncated), "1\n2\n3\n4\n");
  EXPECT_FALSE(truncated);
  EXPECT_EQ(MakePreview("", {2, 100}, &truncated), "");
  EXPECT_FALSE(truncated);
}

TEST(TruncatorTest, ByteBudgetCutsLongLine) {
  std::string text = std::string(50, 'a') + std::string(50, 'b');
  EXPECT_EQ(MakePreview(text, {0, 20}), "aaaaaaaaaa\n...truncated...\nbbbbbbbbbb");
}

TEST(TruncatorTest, CutsAtCharacterBoundary) {
  std::string text;
  for (int i = 0; i < 10; i++) text += "\xc3\xa9";
  EXPECT_EQ(MakePreview(text, {0, 9}), "\xc3\xa9\xc3\xa9\n...truncated...\n\xc3\xa9\xc3\xa9");
}

TEST(TruncatorTest, FullOutputLayout) {
  EXPECT_EQ(FullOutputText("out", "err"), "out\n--- stderr ---\nerr");
  EXPECT_EQ(FullOutputText("out\n", ""), "out\n");
  EXPECT_EQ(FullOutputText("", "err"), "--- stderr ---\nerr");
}

TEST(TruncatorTest, WritesFullOutputBeforeTruncating) {
  std::string out;
  for (int i = 0; i < 1000; i++) out += "line " + std::to_string(i) + "\n";
  fs::path path = kOutputRoot / "truncator-test" / "output.txt";
  TruncatedOutput res = TruncateOutput(out, "warning\n", path, {50, 50 * 1024});
  EXPECT_TRUE(res.truncated);
  EXPECT_EQ(res.full_path, path);
  EXPECT_EQ(ReadFileOrEmpty(path), out + "--- stderr ---\nwarning\n");
  EXPECT_EQ(res.stdout_preview.rfind("line 0\n", 0), 0);
  EXPECT_NE(res.stdout_preview.find("...truncated...\nline 950\n"), std::string::npos);
  EXPECT_EQ(res.stdout_preview.substr(res.stdout_preview.size() - 8), "line 999");
  EXPECT_EQ(res.stderr_preview, "warning\n");
  fs::remove_all(path.parent_path());
}

TEST(TruncatorTest, PreviewSurvivesUnwritableArtifact) {
  TruncatedOutput res = TruncateOutput("a\nb\nc\n", "", "/proc/scriptbox/output.txt", {1, 0});
  EXPECT_TRUE(res.full_path.empty());
  EXPECT_EQ(res.stdout_preview, "a\n...truncated...\nc");
}
