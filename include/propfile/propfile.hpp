#pragma once

/**
 * @file propfile.hpp
 * @brief Main convenience header for propfile
 *
 * Include this single header to access all library functionality.
 *
 * @code
 * #include <propfile/propfile.hpp>
 *
 * int main() {
 *     std::error_code ec;
 *     auto pf = PropFile::PropertyFile::fromFile("app.properties", ec);
 *     if (!pf)
 *         return 1;
 *     pf->set("server.port", "8080");
 *     pf->saveTo("app.properties", ec);
 * }
 * @endcode
 */

// =============================================================================
// Document Model
// =============================================================================
#include "entry/Entry.hpp"
#include "Options.hpp"
#include "PropertyFile.hpp"

// =============================================================================
// Reading / Writing
// =============================================================================
#include "io/EntryParser.hpp"
#include "io/LogicalLineReader.hpp"
#include "io/PropertyFileReader.hpp"
#include "io/PropertyFileWriter.hpp"

// =============================================================================
// Reformatting
// =============================================================================
#include "reformatting/AttachCommentsTo.hpp"
#include "reformatting/OrderableEntry.hpp"
#include "reformatting/PropertyFormat.hpp"
#include "reformatting/ReformatOptions.hpp"
#include "reformatting/Reformatter.hpp"

// =============================================================================
// Utilities
// =============================================================================
#include "util/Charset.hpp"
#include "util/DiagnosticSink.hpp"
#include "util/Errors.hpp"
#include "util/escapeUtil.hpp"

/**
 * @namespace PropFile
 * @brief Root namespace for propfile
 *
 * Key components:
 * - Entries: BasicEntry, PropertyEntry, Entry
 * - Document: PropertyFile, Options
 * - Reformatting: Reformatter, ReformatOptions, AttachCommentsTo
 * - Utilities: escape helpers, Charset, DiagnosticSink
 */
namespace PropFile {

// Version information
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace PropFile
