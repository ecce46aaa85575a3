#pragma once
/// @file Reformatter.hpp
/// @brief Reformatting and reordering of PropertyFiles and files on disk

#include <propfile/PropertyFile.hpp>
#include <propfile/reformatting/PropertyFormat.hpp>
#include <propfile/reformatting/ReformatOptions.hpp>
#include <propfile/util/DiagnosticSink.hpp>

#include <string>
#include <system_error>

namespace PropFile {

/// @brief Applies layouts and orderings to documents
///
/// Every operation has an overload without options that uses the options
/// given at construction. Reordering never fails; reformatting fails with
/// Errc::InvalidFormat before anything is changed. The file variants read
/// the file with the options' charset, transform it and write it back.
class Reformatter {
  public:
    Reformatter() = default;

    explicit Reformatter(ReformatOptions options, DiagnosticSink& sink = nullDiagnosticSink())
        : options_(std::move(options)), sink_(&sink) {}

    const ReformatOptions& options() const noexcept { return options_; }

    // =========================================================================
    // Reformat
    // =========================================================================

    /// @brief Apply the layout of options.format() to every entry
    ///
    /// Property entries get the format's leading whitespace, separator and
    /// line ending; comment and blank lines get the line ending. With
    /// reformatKeyAndValue() keys and values are re-escaped onto one line.
    ///
    /// @param ec Errc::InvalidFormat if the format string is malformed
    bool reformat(PropertyFile& file, std::error_code& ec) const {
        return reformat(file, options_, ec);
    }
    bool reformat(PropertyFile& file, const ReformatOptions& options, std::error_code& ec) const;

    bool reformat(const std::string& path, std::error_code& ec) const {
        return reformat(path, options_, ec);
    }
    bool reformat(const std::string& path, const ReformatOptions& options,
                  std::error_code& ec) const;

    // =========================================================================
    // Reorder by key
    // =========================================================================

    /// @brief Sort entries by escaped key, keeping comments per attachCommentsTo()
    void reorderByKey(PropertyFile& file) const { reorderByKey(file, options_); }
    void reorderByKey(PropertyFile& file, const ReformatOptions& options) const;

    bool reorderByKey(const std::string& path, std::error_code& ec) const {
        return reorderByKey(path, options_, ec);
    }
    bool reorderByKey(const std::string& path, const ReformatOptions& options,
                      std::error_code& ec) const;

    // =========================================================================
    // Reorder by template
    // =========================================================================

    /// @brief Order entries like the properties of @p reference
    ///
    /// Keys not present in @p reference keep their relative order and move
    /// to the end. @p reference is not modified.
    void reorderByTemplate(const PropertyFile& reference, PropertyFile& file) const {
        reorderByTemplate(reference, file, options_);
    }
    void reorderByTemplate(const PropertyFile& reference, PropertyFile& file,
                           const ReformatOptions& options) const;

    bool reorderByTemplate(const PropertyFile& reference, const std::string& path,
                           std::error_code& ec) const {
        return reorderByTemplate(reference, path, options_, ec);
    }
    bool reorderByTemplate(const PropertyFile& reference, const std::string& path,
                           const ReformatOptions& options, std::error_code& ec) const;

    /// @brief Template read from @p templatePath with the options' charset
    bool reorderByTemplate(const std::string& templatePath, const std::string& path,
                           std::error_code& ec) const {
        return reorderByTemplate(templatePath, path, options_, ec);
    }
    bool reorderByTemplate(const std::string& templatePath, const std::string& path,
                           const ReformatOptions& options, std::error_code& ec) const {
        return reorderByTemplate(templatePath, options.charset(), path, options, ec);
    }

    /// @brief Template read from @p templatePath with @p templateCharset
    bool reorderByTemplate(const std::string& templatePath, Charset templateCharset,
                           const std::string& path, const ReformatOptions& options,
                           std::error_code& ec) const;

  private:
    bool writeBack(const PropertyFile& file, const std::string& path,
                   const ReformatOptions& options, std::error_code& ec) const;

    ReformatOptions options_;
    DiagnosticSink* sink_ = &nullDiagnosticSink();
};

} // namespace PropFile
