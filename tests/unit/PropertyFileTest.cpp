/**
 * @file PropertyFileTest.cpp
 * @brief Unit tests for the in-memory document model
 */

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include <propfile/PropertyFile.hpp>

using namespace PropFile;

namespace {

const char* kSample = " # comment line to be removed \n"
                      "keyA1 =  valueA1\n"
                      " \t\n"
                      " # comment line to remain\n"
                      "keyA2 = value A2 \\\n"
                      "          over multiple \\\n"
                      "          lines\n"
                      " # comment line to be removed \n"
                      "keyA3 : value A3\n";

const PropertyEntry kKeyA1("", "keyA1", " =  ", "valueA1", "\n");
const PropertyEntry kKeyA2("", "keyA2", " = ",
                           "value A2 \\\n          over multiple \\\n          lines", "\n");
const PropertyEntry kKeyA3("", "keyA3", " : ", "value A3", "\n");

} // namespace

// =============================================================================
// Parsing and lookup
// =============================================================================

TEST(PropertyFileTest, ParsesEntriesAndIndexesKeys) {
    PropertyFile pf = PropertyFile::fromString(kSample);

    EXPECT_EQ(pf.entriesSize(), 7u);
    EXPECT_EQ(pf.propertiesSize(), 3u);
    EXPECT_EQ(pf.keys(), (std::vector<std::string>{"keyA1", "keyA2", "keyA3"}));
    EXPECT_EQ(pf.values(), (std::vector<std::string>{"valueA1", "value A2 over multiple lines",
                                                      "value A3"}));
    EXPECT_EQ(pf.get("keyA2"), "value A2 over multiple lines");
    EXPECT_FALSE(pf.get("missing").has_value());
    EXPECT_TRUE(pf.containsKey("keyA3"));

    auto pe = pf.getPropertyEntry("keyA2");
    ASSERT_TRUE(pe.has_value());
    EXPECT_EQ(*pe, kKeyA2);
}

TEST(PropertyFileTest, RoundTripIsByteIdentical) {
    PropertyFile pf = PropertyFile::fromString(kSample);
    EXPECT_EQ(pf.toText(), kSample);
    EXPECT_EQ(pf.toString(), kSample);
}

TEST(PropertyFileTest, ContinuedValueEndToEnd) {
    PropertyFile pf = PropertyFile::fromString("keyA = va\\\n  lueA\n");
    EXPECT_EQ(pf.get("keyA"), "valueA");
    EXPECT_EQ(pf.toString(), "keyA = va\\\n  lueA\n");
}

TEST(PropertyFileTest, ToMapUsesUnescapedKeysAndValues) {
    PropertyFile pf = PropertyFile::fromString(" # comment line \n"
                                               "keyA1 =  valueA1\n"
                                               " \t\n"
                                               "key\xE7\xB7\xA8 = value\xD0\xAF \\\n"
                                               "          over multiple \\\n"
                                               "          lines\n"
                                               "otherKey\\u7de8 = otherValue\\u042f\n");
    const auto map = pf.toMap();
    ASSERT_EQ(map.size(), 3u);
    EXPECT_EQ(map.at("keyA1"), "valueA1");
    EXPECT_EQ(map.at("key\xE7\xB7\xA8"), "value\xD0\xAF over multiple lines");
    EXPECT_EQ(map.at("otherKey\xE7\xB7\xA8"), "otherValue\xD0\xAF");
}

// =============================================================================
// set / remove
// =============================================================================

TEST(PropertyFileTest, SetKeepsFormattingOfExistingEntry) {
    PropertyFile pf = PropertyFile::fromString("  keyA1\t:  old\r\n");
    pf.set("keyA1", "new value");
    EXPECT_EQ(pf.toText(), "  keyA1\t:  new value\r\n");
}

TEST(PropertyFileTest, SetAppendsNewKeyWithDefaultFormat) {
    PropertyFile pf = PropertyFile::fromString("a = 1\n");
    pf.set("my key", "line1\nline2");
    EXPECT_EQ(pf.toText(), "a = 1\nmy\\ key = line1\\nline2\n");
    EXPECT_EQ(pf.get("my key"), "line1\nline2");
    EXPECT_EQ(pf.keys().back(), "my key");
}

TEST(PropertyFileTest, SetValueWithEscapedLiteralNewline) {
    PropertyFile pf;
    pf.setValue("my Key1", "my\\nvalue 1");
    pf.setValue("my\\Key2", "my\\value2");

    EXPECT_EQ(pf.propertiesSize(), 2u);
    EXPECT_EQ(pf.get("my Key1"), "my\\nvalue 1");
    EXPECT_EQ(pf.get("my\\Key2"), "my\\value2");
}

TEST(PropertyFileTest, RemoveByKeyRemovesIndexedEntryOnly) {
    PropertyFile pf;
    pf.appendEntry(PropertyEntry("dup", "first"));
    pf.appendEntry(PropertyEntry("other", "x"));
    pf.appendEntry(PropertyEntry("dup", "second"));

    pf.remove("dup");
    EXPECT_FALSE(pf.containsKey("dup"));
    EXPECT_EQ(pf.entriesSize(), 2u);
    EXPECT_EQ(pf.entryAt(0), Entry(PropertyEntry("dup", "first")));
    EXPECT_EQ(pf.keys(), (std::vector<std::string>{"other"}));
}

TEST(PropertyFileTest, RemovePropertyEntry) {
    PropertyFile pf = PropertyFile::fromString("keyA1 =  valueA1\n"
                                               " \t\n"
                                               "keyA3 : value A3\n");
    pf.remove(Entry(kKeyA1));

    EXPECT_EQ(pf.allEntries(), (std::vector<Entry>{BasicEntry(" \t\n"), kKeyA3}));
    EXPECT_FALSE(pf.containsKey("keyA1"));
}

TEST(PropertyFileTest, RemoveBasicEntryRemovesAllOccurrences) {
    PropertyFile pf = PropertyFile::fromString(kSample);
    pf.remove(Entry(BasicEntry(" # comment line to be removed \n")));

    EXPECT_EQ(pf.allEntries(),
              (std::vector<Entry>{kKeyA1, BasicEntry(" \t\n"),
                                  BasicEntry(" # comment line to remain\n"), kKeyA2, kKeyA3}));
    EXPECT_EQ(pf.propertiesSize(), 3u);
}

TEST(PropertyFileTest, RemoveEntryWithEscapedKeyDropsIndex) {
    PropertyFile pf;
    pf.set("a b", "1");
    pf.set("c", "2");
    const auto entry = pf.getPropertyEntry("a b");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->key(), "a\\ b");

    pf.remove(Entry(*entry));
    EXPECT_FALSE(pf.containsKey("a b"));
    EXPECT_EQ(pf.keys(), (std::vector<std::string>{"c"}));
    EXPECT_EQ(pf.entriesSize(), 1u);
}

TEST(PropertyFileTest, RemoveShadowedDuplicateKeepsIndex) {
    PropertyFile pf;
    pf.appendEntry(PropertyEntry("myKey", "myValue"));
    pf.appendEntry(PropertyEntry("myKey", "shadowingValue"));

    pf.remove(Entry(PropertyEntry("myKey", "myValue")));
    EXPECT_EQ(pf.entriesSize(), 1u);
    EXPECT_EQ(pf.get("myKey"), "shadowingValue");
    EXPECT_EQ(pf.keys(), (std::vector<std::string>{"myKey"}));
}

// =============================================================================
// replace
// =============================================================================

TEST(PropertyFileTest, ReplaceBasicWithBasicOnlyFirstOccurrence) {
    PropertyFile pf = PropertyFile::fromString(kSample);
    EXPECT_TRUE(pf.replace(BasicEntry(" # comment line to be removed \n"),
                           BasicEntry(" # the new comment\n")));

    EXPECT_EQ(pf.entryAt(0), Entry(BasicEntry(" # the new comment\n")));
    EXPECT_EQ(pf.entryAt(5), Entry(BasicEntry(" # comment line to be removed \n")));
}

TEST(PropertyFileTest, ReplaceBasicWithPropertyIndexesNewKey) {
    PropertyFile pf = PropertyFile::fromString(kSample);
    EXPECT_TRUE(pf.replace(BasicEntry(" # comment line to be removed \n"),
                           PropertyEntry("newKey", "newValue")));

    EXPECT_EQ(pf.entryAt(0), Entry(PropertyEntry("newKey", "newValue")));
    EXPECT_EQ(pf.get("newKey"), "newValue");
    EXPECT_EQ(pf.propertiesSize(), 4u);
}

TEST(PropertyFileTest, ReplacePropertyWithBasicDropsKey) {
    PropertyFile pf = PropertyFile::fromString(kSample);
    EXPECT_TRUE(pf.replace(kKeyA3, BasicEntry("# replacement")));

    EXPECT_EQ(pf.entryAt(6), Entry(BasicEntry("# replacement")));
    EXPECT_FALSE(pf.containsKey("keyA3"));
    EXPECT_EQ(pf.propertiesSize(), 2u);
}

TEST(PropertyFileTest, ReplaceNonexistentChangesNothing) {
    PropertyFile pf = PropertyFile::fromString(kSample);
    const PropertyFile before = pf;

    EXPECT_FALSE(pf.replace(BasicEntry("# This entry does not exist\n"),
                            PropertyEntry("ghost", "value")));
    EXPECT_EQ(pf, before);
    EXPECT_FALSE(pf.containsKey("ghost"));
}

// =============================================================================
// Duplicates / clear / setEntries
// =============================================================================

TEST(PropertyFileTest, AppendDuplicateKeyLastWriteWins) {
    PropertyFile pf;
    pf.appendEntry(PropertyEntry("myKey", "myValue"));
    pf.appendEntry(PropertyEntry("someOtherKey", "withAnotherValue"));
    pf.appendEntry(PropertyEntry("myKey", "shadowingValue"));

    EXPECT_EQ(pf.entriesSize(), 3u);
    EXPECT_EQ(pf.propertiesSize(), 2u);
    EXPECT_EQ(pf.get("myKey"), "shadowingValue");
    EXPECT_EQ(pf.keys(), (std::vector<std::string>{"myKey", "someOtherKey"}));
    EXPECT_EQ(pf.toString(), "myKey = myValue\n"
                             "someOtherKey = withAnotherValue\n"
                             "myKey = shadowingValue\n");
}

TEST(PropertyFileTest, Clear) {
    PropertyFile pf = PropertyFile::fromString(kSample);
    pf.clear();
    EXPECT_EQ(pf.entriesSize(), 0u);
    EXPECT_TRUE(pf.toMap().empty());
    EXPECT_TRUE(pf.keys().empty());
}

TEST(PropertyFileTest, SetEntriesRebuildsIndex) {
    PropertyFile pf = PropertyFile::fromString(kSample);
    const std::vector<Entry> newEntries = {
        PropertyEntry("some\\ new\\ property", "with a value"),
        BasicEntry("    "),
        PropertyEntry("oh", "my"),
        BasicEntry("# finish"),
    };
    pf.setEntries(newEntries);

    EXPECT_EQ(pf.allEntries(), newEntries);
    const auto map = pf.toMap();
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map.at("some new property"), "with a value");
    EXPECT_EQ(map.at("oh"), "my");
}

TEST(PropertyFileTest, ReorderRejectsNonPermutation) {
    PropertyFile pf = PropertyFile::fromString("a = 1\nb = 2\n");
    EXPECT_THROW(pf.reorder({0}), std::invalid_argument);
    EXPECT_THROW(pf.reorder({0, 0}), std::invalid_argument);
    EXPECT_THROW(pf.reorder({0, 2}), std::invalid_argument);

    pf.reorder({1, 0});
    EXPECT_EQ(pf.toText(), "b = 2\na = 1\n");
    EXPECT_EQ(pf.get("a"), "1");
}

// =============================================================================
// Copy semantics / equality
// =============================================================================

TEST(PropertyFileTest, CloneIsIndependent) {
    PropertyFile original = PropertyFile::fromString(kSample);
    PropertyFile copy = original.clone();
    EXPECT_EQ(copy, original);

    copy.set("keyA1", "changed");
    copy.appendEntry(BasicEntry("# new\n"));

    EXPECT_EQ(original.get("keyA1"), "valueA1");
    EXPECT_EQ(original.entriesSize(), 7u);
    EXPECT_NE(copy, original);

    PropertyFile other = PropertyFile::from(original);
    original.remove("keyA2");
    EXPECT_TRUE(other.containsKey("keyA2"));
}

TEST(PropertyFileTest, EqualityIsStructural) {
    PropertyFile a = PropertyFile::fromString("key = value\n");
    PropertyFile b = PropertyFile::fromString("key=value\n");
    EXPECT_EQ(a.toMap(), b.toMap());
    EXPECT_NE(a, b);
    EXPECT_EQ(a, PropertyFile::fromString("key = value\n"));
}

// =============================================================================
// Streams
// =============================================================================

TEST(PropertyFileTest, FromStreamAndSaveToStream) {
    std::istringstream in("a = \xE4\n", std::ios::binary);
    std::error_code ec;
    auto pf = PropertyFile::fromStream(in, ec, Charset::Iso8859_1);
    ASSERT_TRUE(pf.has_value());
    EXPECT_EQ(pf->get("a"), "\xC3\xA4");

    std::ostringstream out;
    ASSERT_TRUE(pf->saveTo(out, Options().with(Charset::Utf8), ec));
    EXPECT_EQ(out.str(), "a = \xC3\xA4\n");
}

TEST(PropertyFileTest, OverwriteFailingStreamReportsError) {
    PropertyFile pf = PropertyFile::fromString("a = 1\n");
    std::ostringstream out;
    out.setstate(std::ios::badbit);

    std::error_code ec;
    EXPECT_FALSE(pf.overwrite(out, ec));
    EXPECT_EQ(ec, std::errc::io_error);
}

TEST(PropertyFileTest, MalformedUnicodeIsReportedToDocumentSink) {
    CollectingDiagnosticSink sink;
    PropertyFile pf = PropertyFile::fromString("key = broken\\uZZZZ\n", sink);
    EXPECT_EQ(pf.get("key"), "broken\\uZZZZ");
    EXPECT_GE(sink.count(Severity::Error), 1u);
}
