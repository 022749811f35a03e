#include <gtest/gtest.h>
#include "core/StringUtils.hpp"
#include "core/TimeUtils.hpp"
#include "core/Crypto.hpp"

using namespace ward;

TEST(StringUtilsTest, BasenameHandlesBothSeparators) {
    EXPECT_EQ(Basename("C:\\Windows\\System32\\lsass.exe"), "lsass.exe");
    EXPECT_EQ(Basename("/usr/bin/python3"), "python3");
    EXPECT_EQ(Basename("notepad.exe"), "notepad.exe");
    EXPECT_EQ(Basename("C:\\Temp\\"), "");
}

TEST(StringUtilsTest, LowerExtension) {
    EXPECT_EQ(LowerExtension("C:\\Users\\Public\\Payload.EXE"), ".exe");
    EXPECT_EQ(LowerExtension("/tmp/archive.tar.gz"), ".gz");
    EXPECT_EQ(LowerExtension("C:\\dir.d\\README"), "");
    EXPECT_EQ(LowerExtension(".bashrc"), "");
}

TEST(StringUtilsTest, WildcardMatch) {
    EXPECT_TRUE(WildcardMatch("*\\currentversion\\run\\*",
                              "hklm\\software\\microsoft\\windows\\currentversion\\run\\updater"));
    EXPECT_FALSE(WildcardMatch("*\\currentversion\\run\\*",
                               "hklm\\software\\microsoft\\windows\\currentversion\\runonce"));
    EXPECT_TRUE(WildcardMatch("*\\currentversion\\runonce*",
                              "hkcu\\software\\microsoft\\windows\\currentversion\\runonce"));
    EXPECT_TRUE(WildcardMatch("file?.txt", "file1.txt"));
    EXPECT_FALSE(WildcardMatch("file?.txt", "file12.txt"));
    EXPECT_TRUE(WildcardMatch("*", ""));
    EXPECT_FALSE(WildcardMatch("abc", "ABC"));
}

TEST(StringUtilsTest, ParseUint32IsStrict) {
    uint32_t value = 0;
    EXPECT_TRUE(ParseUint32("4242", value));
    EXPECT_EQ(value, 4242u);
    EXPECT_TRUE(ParseUint32("4294967295", value));
    EXPECT_EQ(value, 4294967295u);

    EXPECT_FALSE(ParseUint32("4294967296", value));
    EXPECT_FALSE(ParseUint32("", value));
    EXPECT_FALSE(ParseUint32("-1", value));
    EXPECT_FALSE(ParseUint32("12ab", value));
    EXPECT_FALSE(ParseUint32(" 12", value));
}

TEST(StringUtilsTest, Join) {
    EXPECT_EQ(Join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(Join({}, ","), "");
}

TEST(TimeUtilsTest, FormatsUtcTimestamps) {
    // 2024-05-01T12:30:00.123Z
    const uint64_t ms = 1714566600123ULL;
    EXPECT_EQ(TimestampToISO8601(ms), "2024-05-01T12:30:00.123Z");
    EXPECT_EQ(TimestampToCompact(ms), "20240501_123000");
}

TEST(CryptoTest, UuidIsVersion4) {
    std::string a = GenerateUUID();
    std::string b = GenerateUUID();

    ASSERT_EQ(a.size(), 36u);
    EXPECT_EQ(a[8], '-');
    EXPECT_EQ(a[14], '4');
    EXPECT_NE(a, b);
}

TEST(CryptoTest, Sha256KnownVector) {
    EXPECT_EQ(Sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
