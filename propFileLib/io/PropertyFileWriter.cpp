#include <propfile/io/PropertyFileWriter.hpp>
#include <propfile/util/FileIo.hpp>
#include <propfile/util/escapeUtil.hpp>

namespace PropFile {

std::string PropertyFileWriter::applyUnicodeHandling(std::string_view text,
                                                     UnicodeHandling handling, Charset charset,
                                                     DiagnosticSink& sink) {
    // 유니코드를 표현할 수 없는 charset은 정책과 무관하게 항상 escape한다.
    if (handling == UnicodeHandling::Escape || !isUnicodeCapable(charset))
        return util::escapeUnicode(text);

    switch (handling) {
    case UnicodeHandling::Unicode:
    case UnicodeHandling::ByCharset:
        return util::unescapeUnicode(text, sink);
    case UnicodeHandling::DoNothing:
    case UnicodeHandling::Escape:
        break;
    }
    return std::string(text);
}

void PropertyFileWriter::writeEntry(const Entry& entry) {
    text_ += applyUnicodeHandling(toText(entry), options_.unicodeHandling(), options_.charset(),
                                  *sink_);
}

void PropertyFileWriter::writeEntries(const std::vector<Entry>& entries) {
    for (const auto& entry : entries)
        writeEntry(entry);
}

std::string PropertyFileWriter::encoded() const {
    return encodeText(text_, options_.charset(), *sink_);
}

bool PropertyFileWriter::writeTo(std::ostream& os, std::error_code& ec) const {
    ec.clear();
    const std::string bytes = encoded();
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }
    return true;
}

bool PropertyFileWriter::writeTo(int fd, std::error_code& ec) const {
    return detail::replaceContents(fd, encoded(), ec);
}

bool PropertyFileWriter::writeToFile(const std::string& path, bool createParents,
                                     std::error_code& ec) const {
    return detail::writeFile(path, encoded(), createParents, ec, *sink_);
}

} // namespace PropFile
