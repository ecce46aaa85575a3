#pragma once
/// @file PropertyFile.hpp
/// @brief Format-preserving in-memory model of a .properties document

#include <propfile/Options.hpp>
#include <propfile/entry/Entry.hpp>
#include <propfile/util/Charset.hpp>
#include <propfile/util/DiagnosticSink.hpp>

#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace PropFile {

class ReformatOptions;

/// @brief Ordered sequence of entries plus an index from unescaped key to entry
///
/// Entries live in an internal arena and are addressed by handle, so the
/// sequence and the key index always see the same entry. Copying a
/// PropertyFile copies every entry; copies share no mutable state.
///
/// Keys and values passed to set()/get()/remove() are unescaped; the
/// entries themselves keep the escaped file text.
///
/// @code
/// std::error_code ec;
/// auto pf = PropFile::PropertyFile::fromFile("app.properties", ec);
/// if (!pf) { ... }
/// pf->set("timeout", "30");
/// pf->saveTo("app.properties", ec);
/// @endcode
class PropertyFile {
  public:
    PropertyFile() = default;

    /// @param sink Receives diagnostics for lookups that unescape text
    explicit PropertyFile(DiagnosticSink& sink) : sink_(&sink) {}

    // =========================================================================
    // Construction
    // =========================================================================

    /// @brief Read a file under a shared lock
    /// @return std::nullopt on I/O failure (ec set)
    static std::optional<PropertyFile> fromFile(const std::string& path, std::error_code& ec,
                                                Charset charset = Charset::Utf8,
                                                DiagnosticSink& sink = nullDiagnosticSink());

    /// @brief Parse already decoded text
    static PropertyFile fromString(std::string text, DiagnosticSink& sink = nullDiagnosticSink());

    /// @brief Decode and parse raw bytes
    static PropertyFile fromBytes(std::string_view bytes, Charset charset = Charset::Utf8,
                                  DiagnosticSink& sink = nullDiagnosticSink());

    /// @brief Drain, decode and parse a byte stream
    static std::optional<PropertyFile> fromStream(std::istream& is, std::error_code& ec,
                                                  Charset charset = Charset::Utf8,
                                                  DiagnosticSink& sink = nullDiagnosticSink());

    /// @brief Deep copy of another document
    static PropertyFile from(const PropertyFile& other) { return other; }

    PropertyFile clone() const { return *this; }

    // =========================================================================
    // Entry sequence
    // =========================================================================

    /// @brief Append an entry at the end
    ///
    /// A PropertyEntry becomes the indexed entry for its unescaped key even if
    /// an earlier entry has the same key.
    void appendEntry(Entry entry);

    /// @brief Remove every entry structurally equal to @p entry
    void remove(const Entry& entry);

    /// @brief Replace the first entry equal to @p oldEntry
    /// @return false if no such entry exists; nothing is changed then
    bool replace(const Entry& oldEntry, Entry newEntry);

    /// @brief Copy of all entries in document order
    std::vector<Entry> allEntries() const;

    /// @brief Entry at @p position (0 <= position < entriesSize())
    const Entry& entryAt(size_t position) const { return arena_[order_.at(position)]; }

    /// @brief Number of entries of both kinds
    size_t entriesSize() const noexcept { return order_.size(); }

    /// @brief Drop all entries and the key index
    void clear() noexcept;

    /// @brief Replace all entries and rebuild the key index
    void setEntries(const std::vector<Entry>& entries);

    /// @brief Rearrange the entry sequence without touching the key index
    /// @param newOrder newOrder[i] is the current position of the entry that
    ///                 moves to position i; must be a permutation
    /// @throws std::invalid_argument if @p newOrder is not a permutation
    void reorder(const std::vector<size_t>& newOrder);

    // =========================================================================
    // Key/value access (unescaped)
    // =========================================================================

    /// @brief Set a value, keeping the formatting of an existing entry
    ///
    /// An existing entry only gets its value replaced. A new key is appended
    /// as "key = value\n".
    void set(const std::string& key, const std::string& value);

    void setValue(const std::string& key, const std::string& value) { set(key, value); }

    /// @brief Unescaped value of the indexed entry for @p key
    std::optional<std::string> get(const std::string& key) const;

    /// @brief Copy of the indexed entry for @p key
    std::optional<PropertyEntry> getPropertyEntry(const std::string& key) const;

    /// @brief Remove the indexed entry for @p key (other duplicates stay)
    void remove(const std::string& key);

    bool containsKey(const std::string& key) const { return index_.count(key) > 0; }

    /// @brief Unique keys in order of first insertion
    const std::vector<std::string>& keys() const noexcept { return keyOrder_; }

    /// @brief Unescaped values in the order of keys()
    std::vector<std::string> values() const;

    /// @brief Unescaped key/value pairs
    std::map<std::string, std::string> toMap() const;

    /// @brief Number of unique keys
    size_t propertiesSize() const noexcept { return index_.size(); }

    // =========================================================================
    // Output
    // =========================================================================

    /// @brief Update @p path in place if it exists, otherwise create it
    bool saveTo(const std::string& path, std::error_code& ec) const {
        return saveTo(path, Options(), ec);
    }
    bool saveTo(const std::string& path, const Options& options, std::error_code& ec) const;

    /// @brief Write to a stream (same as overwrite)
    bool saveTo(std::ostream& os, std::error_code& ec) const { return overwrite(os, Options(), ec); }
    bool saveTo(std::ostream& os, const Options& options, std::error_code& ec) const {
        return overwrite(os, options, ec);
    }

    /// @brief Merge this document into an existing file, keeping its formatting
    ///
    /// The target is read and rewritten under an exclusive lock. A value is
    /// only rewritten if its unescaped form differs. Keys missing in the
    /// target are appended; keys missing here are handled by
    /// Options::missingKeyAction().
    ///
    /// @param ec std::errc::no_such_file_or_directory if @p path does not exist
    bool update(const std::string& path, std::error_code& ec) const {
        return update(path, Options(), ec);
    }
    bool update(const std::string& path, const Options& options, std::error_code& ec) const;

    /// @brief Replace the file content with this document
    ///
    /// Missing parent directories are created. Always writes with
    /// UnicodeHandling::ByCharset.
    bool overwrite(const std::string& path, std::error_code& ec) const {
        return overwrite(path, Options(), ec);
    }
    bool overwrite(const std::string& path, const Options& options, std::error_code& ec) const;

    bool overwrite(std::ostream& os, std::error_code& ec) const {
        return overwrite(os, Options(), ec);
    }
    bool overwrite(std::ostream& os, const Options& options, std::error_code& ec) const;

    /// @brief Serialized bytes as they would be written with @p options
    std::string toString(const Options& options = Options()) const;

    /// @brief Concatenated text of all entries, without charset conversion
    std::string toText() const;

    // =========================================================================
    // Reformatting
    // =========================================================================

    bool reformat(std::error_code& ec);
    bool reformat(const ReformatOptions& options, std::error_code& ec);
    void reorderByKey();
    void reorderByKey(const ReformatOptions& options);
    void reorderByTemplate(const PropertyFile& reference);
    void reorderByTemplate(const PropertyFile& reference, const ReformatOptions& options);

    // =========================================================================
    // Misc
    // =========================================================================

    void setDiagnosticSink(DiagnosticSink& sink) noexcept { sink_ = &sink; }
    DiagnosticSink& diagnosticSink() const noexcept { return *sink_; }

    /// @brief Structural equality of the entry sequences
    bool operator==(const PropertyFile& other) const;
    bool operator!=(const PropertyFile& other) const { return !(*this == other); }

  private:
    using Handle = size_t;

    Handle allocate(Entry entry);
    void release(Handle handle);
    void indexPut(const std::string& key, Handle handle);
    void indexErase(const std::string& key);
    void dropIndexFor(Handle handle);
    void mergeInto(PropertyFile& target, MissingKeyAction action) const;

    std::vector<Entry> arena_;
    std::vector<Handle> freeSlots_;
    std::vector<Handle> order_;
    std::unordered_map<std::string, Handle> index_;
    std::vector<std::string> keyOrder_;
    DiagnosticSink* sink_ = &nullDiagnosticSink();
};

} // namespace PropFile
