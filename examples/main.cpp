#include <cstdio>
#include <iostream>
#include <string>

#include <propfile/propfile.hpp>

using namespace PropFile;

// =============================================================================
// Helper Macros for Demo Output
// =============================================================================

#define TEST_SECTION(name) std::cout << "\n=== " << name << " ===\n"
#define TEST_CASE(name) std::cout << "\n--- " << name << " ---\n"
#define TEST_PASS(msg) std::cout << "[PASS] " << msg << "\n"
#define TEST_FAIL(msg) std::cout << "[FAIL] " << msg << "\n"
#define CHECK_EC(ec, context)                                                                      \
    if (ec) {                                                                                      \
        TEST_FAIL(context << ": " << ec.message());                                                \
        return;                                                                                    \
    }

namespace {

const char* kDemoFile = "./demo.properties";
const char* kTemplateFile = "./demo_template.properties";

void printFile(const std::string& path) {
    std::error_code ec;
    auto pf = PropertyFile::fromFile(path, ec);
    if (!pf) {
        TEST_FAIL("Read " << path << ": " << ec.message());
        return;
    }
    std::cout << pf->toText();
}

} // namespace

// =============================================================================
// Document Editing
// =============================================================================

void demoEditing() {
    TEST_SECTION("Document Editing");
    std::error_code ec;
    StderrDiagnosticSink sink;

    ::remove(kDemoFile);

    // =========================================================================
    // 1. Create a new file
    // =========================================================================
    TEST_CASE("Create");

    PropertyFile pf(sink);
    pf.appendEntry(BasicEntry("# Application settings\n"));
    pf.set("server.host", "localhost");
    pf.set("server.port", "8080");
    pf.appendEntry(BasicEntry("\n"));
    pf.appendEntry(BasicEntry("# Greeting shown on the start page\n"));
    pf.set("greeting", "Hello,\nWorld");

    pf.saveTo(kDemoFile, ec);
    CHECK_EC(ec, "Save new file");
    TEST_PASS("Created " << kDemoFile << " with " << pf.propertiesSize() << " properties");
    printFile(kDemoFile);

    // =========================================================================
    // 2. Reload and read values
    // =========================================================================
    TEST_CASE("Reload");

    auto loaded = PropertyFile::fromFile(kDemoFile, ec, Charset::Utf8, sink);
    CHECK_EC(ec, "Reload");
    for (const auto& key : loaded->keys())
        TEST_PASS(key << " -> \"" << *loaded->get(key) << "\"");

    // =========================================================================
    // 3. Hand-edited formatting survives updates
    // =========================================================================
    TEST_CASE("Update keeps formatting");

    PropertyFile handEdited = PropertyFile::fromString("# Application settings\n"
                                                       "server.host   :   example.org\n"
                                                       "server.port = 8080\n"
                                                       "legacy.flag = true\n",
                                                       sink);
    handEdited.overwrite(kDemoFile, ec);
    CHECK_EC(ec, "Overwrite");

    PropertyFile changes(sink);
    changes.set("server.host", "example.org");
    changes.set("server.port", "9090");
    changes.set("server.timeout", "30");
    changes.update(kDemoFile, Options().with(MissingKeyAction::Comment), ec);
    CHECK_EC(ec, "Update");
    TEST_PASS("Updated port, added timeout, commented out legacy.flag");
    printFile(kDemoFile);
}

// =============================================================================
// Reformatting
// =============================================================================

void demoReformatting() {
    TEST_SECTION("Reformatting");
    std::error_code ec;
    StderrDiagnosticSink sink;

    // =========================================================================
    // 1. Sort by key, comments move with the following property
    // =========================================================================
    TEST_CASE("Reorder by key");

    const Reformatter reformatter(ReformatOptions(), sink);
    reformatter.reorderByKey(kDemoFile, ec);
    CHECK_EC(ec, "Reorder by key");
    printFile(kDemoFile);

    // =========================================================================
    // 2. Order like a template
    // =========================================================================
    TEST_CASE("Reorder by template");

    PropertyFile::fromString("server.timeout = \nserver.port = \nserver.host = \n")
        .overwrite(kTemplateFile, ec);
    CHECK_EC(ec, "Write template");
    reformatter.reorderByTemplate(kTemplateFile, kDemoFile, ec);
    CHECK_EC(ec, "Reorder by template");
    printFile(kDemoFile);

    // =========================================================================
    // 3. Uniform layout
    // =========================================================================
    TEST_CASE("Reformat");

    reformatter.reformat(kDemoFile, ReformatOptions().withFormat("<key>: <value>\\n"), ec);
    CHECK_EC(ec, "Reformat");
    printFile(kDemoFile);

    // =========================================================================
    // 4. Invalid layout is rejected
    // =========================================================================
    TEST_CASE("Invalid format");

    CollectingDiagnosticSink collected;
    Reformatter(ReformatOptions().withFormat("<key> <value>"), collected).reformat(kDemoFile, ec);
    if (ec == make_error_code(Errc::InvalidFormat))
        TEST_PASS("Rejected: " << collected.diagnostics().front().message);
    else
        TEST_FAIL("Expected InvalidFormat, got: " << ec.message());

    ::remove(kTemplateFile);
}

// =============================================================================
// Charsets
// =============================================================================

void demoCharsets() {
    TEST_SECTION("Charsets");
    std::error_code ec;

    // U+00FC U+7DE8
    PropertyFile pf;
    pf.set("word", "Schl\xC3\xBCssel \xE7\xB7\xA8");

    TEST_CASE("UTF-8");
    std::cout << pf.toString(Options().with(Charset::Utf8));

    TEST_CASE("ISO-8859-1 (escaped)");
    pf.overwrite(kDemoFile, Options().with(Charset::Iso8859_1), ec);
    CHECK_EC(ec, "Write ISO-8859-1");
    printFile(kDemoFile);

    ::remove(kDemoFile);
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "========================================\n";
    std::cout << "    propfile " << VERSION_STRING << " Demo\n";
    std::cout << "========================================\n";

    demoEditing();
    demoReformatting();
    demoCharsets();

    std::cout << "\n========================================\n";
    std::cout << "    Demo Completed\n";
    std::cout << "========================================\n";

    return 0;
}
