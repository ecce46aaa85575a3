/**
 * @file PropertyFileWriterTest.cpp
 * @brief Unit tests for serialization and the unicode handling policies
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

#include <propfile/io/PropertyFileWriter.hpp>
#include <propfile/util/FileIo.hpp>

using namespace PropFile;

namespace {

// U+00FC U+069A / U+00C4 U+1234 / U+7DE8 U+042F
const char* kUtf8Key = "UTF-8-key-\xC3\x84\xE1\x88\xB4";
const char* kUtf8Value = "UTF-8-value-\xE7\xB7\xA8\xD0\xAF";

std::vector<Entry> unicodeEntries() {
    return {PropertyEntry("keyA1", "Sch\\u00fcssel\\u069a"), PropertyEntry(kUtf8Key, kUtf8Value)};
}

std::string written(Charset charset, UnicodeHandling handling) {
    PropertyFileWriter writer(Options().with(charset).with(handling));
    writer.writeEntries(unicodeEntries());
    return writer.encoded();
}

const std::string kEscaped = "keyA1 = Sch\\u00fcssel\\u069a\n"
                             "UTF-8-key-\\u00c4\\u1234 = UTF-8-value-\\u7de8\\u042f\n";

} // namespace

// =============================================================================
// Layout
// =============================================================================

TEST(PropertyFileWriterTest, WriteEntries) {
    PropertyFileWriter writer;
    writer.writeEntries({BasicEntry("# Starting comment\n"), BasicEntry("\n"),
                         PropertyEntry("", "keyA1", " = ", "valueA1", "\n"),
                         PropertyEntry(" ", "keyA2", ":", "valueA2", "\n")});

    EXPECT_EQ(writer.encoded(), "# Starting comment\n"
                                "\n"
                                "keyA1 = valueA1\n"
                                " keyA2:valueA2\n");
}

TEST(PropertyFileWriterTest, DefaultFormattingForKeyAndValueOnly) {
    PropertyFileWriter writer;
    writer.writeEntry(PropertyEntry("keyA1", "valueA1"));
    EXPECT_EQ(writer.text(), "keyA1 = valueA1\n");
}

TEST(PropertyFileWriterTest, DifferentLineEndingsArePreserved) {
    PropertyFileWriter writer;
    writer.writeEntries({BasicEntry("# Starting comment\n"), BasicEntry("\r"),
                         PropertyEntry("", "keyA1", " = ", "valueA1", "\r\n"),
                         PropertyEntry(" ", "keyA2", ":", "valueA2", "")});

    EXPECT_EQ(writer.encoded(), "# Starting comment\n"
                                "\r"
                                "keyA1 = valueA1\r\n"
                                " keyA2:valueA2");
}

TEST(PropertyFileWriterTest, MultilineEntriesAreWrittenVerbatim) {
    PropertyFileWriter writer;
    writer.writeEntry(PropertyEntry("", "keyA1\\ \\\n\tover\\ multiple\\ lines", " = ",
                                    "valueA1 \r\tover multiple lines", "\n"));
    EXPECT_EQ(writer.encoded(),
              "keyA1\\ \\\n\tover\\ multiple\\ lines = valueA1 \r\tover multiple lines\n");
}

// =============================================================================
// Unicode handling per charset
// =============================================================================

TEST(PropertyFileWriterTest, Utf8DoNothingKeepsText) {
    EXPECT_EQ(written(Charset::Utf8, UnicodeHandling::DoNothing),
              std::string("keyA1 = Sch\\u00fcssel\\u069a\n") + kUtf8Key + " = " + kUtf8Value +
                  "\n");
}

TEST(PropertyFileWriterTest, Utf8ByCharsetUnescapes) {
    const std::string expected = std::string("keyA1 = Sch\xC3\xBCssel\xDA\x9A\n") + kUtf8Key +
                                 " = " + kUtf8Value + "\n";
    EXPECT_EQ(written(Charset::Utf8, UnicodeHandling::ByCharset), expected);
    EXPECT_EQ(written(Charset::Utf8, UnicodeHandling::Unicode), expected);
}

TEST(PropertyFileWriterTest, Utf8EscapeEscapesEverythingNonAscii) {
    EXPECT_EQ(written(Charset::Utf8, UnicodeHandling::Escape), kEscaped);
}

TEST(PropertyFileWriterTest, Latin1AlwaysEscapes) {
    for (auto handling : {UnicodeHandling::Escape, UnicodeHandling::Unicode,
                          UnicodeHandling::DoNothing, UnicodeHandling::ByCharset}) {
        EXPECT_EQ(written(Charset::Iso8859_1, handling), kEscaped) << toString(handling);
    }
}

TEST(PropertyFileWriterTest, EscapedBackslashBeforeUIsNotUnescaped) {
    PropertyFileWriter writer(Options().with(UnicodeHandling::Unicode));
    writer.writeEntry(PropertyEntry("path", "C:\\\\u0041"));
    EXPECT_EQ(writer.encoded(), "path = C:\\\\u0041\n");
}

TEST(PropertyFileWriterTest, Utf16EncodesWholeText) {
    PropertyFileWriter writer(Options().with(Charset::Utf16BE));
    writer.writeEntry(BasicEntry("#\n"));
    EXPECT_EQ(writer.encoded(), std::string("\0#\0\n", 4));
}

// =============================================================================
// Sinks
// =============================================================================

TEST(PropertyFileWriterTest, WriteToStream) {
    PropertyFileWriter writer;
    writer.writeEntry(PropertyEntry("a", "1"));

    std::ostringstream os;
    std::error_code ec;
    ASSERT_TRUE(writer.writeTo(os, ec));
    EXPECT_FALSE(ec);
    EXPECT_EQ(os.str(), "a = 1\n");
}

TEST(PropertyFileWriterTest, WriteToFileCreatesParents) {
    const std::string dir = "./test_writer_dir.tmp";
    const std::string path = dir + "/nested/out.properties";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    PropertyFileWriter writer;
    writer.writeEntry(PropertyEntry("a", "1"));

    ASSERT_FALSE(writer.writeToFile(path, false, ec));
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);

    ASSERT_TRUE(writer.writeToFile(path, true, ec)) << ec.message();
    std::string content;
    ASSERT_TRUE(detail::readFile(path, content, ec));
    EXPECT_EQ(content, "a = 1\n");

    std::filesystem::remove_all(dir, ec);
}
