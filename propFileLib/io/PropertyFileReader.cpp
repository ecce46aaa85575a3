#include <propfile/io/EntryParser.hpp>
#include <propfile/io/PropertyFileReader.hpp>
#include <propfile/util/FileIo.hpp>

#include <iterator>

namespace PropFile {

std::optional<PropertyFileReader> PropertyFileReader::open(const std::string& path,
                                                           Charset charset, std::error_code& ec,
                                                           DiagnosticSink& sink) {
    std::string bytes;
    if (!detail::readFile(path, bytes, ec, sink))
        return std::nullopt;
    return PropertyFileReader(decodeBytes(bytes, charset, sink));
}

PropertyFileReader PropertyFileReader::fromBytes(std::string_view bytes, Charset charset,
                                                 DiagnosticSink& sink) {
    return PropertyFileReader(decodeBytes(bytes, charset, sink));
}

std::optional<PropertyFileReader> PropertyFileReader::fromStream(std::istream& is,
                                                                 Charset charset,
                                                                 std::error_code& ec,
                                                                 DiagnosticSink& sink) {
    ec.clear();
    std::string bytes((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    // EOF에 도달하면 failbit도 설정될 수 있으므로 badbit만 오류로 본다.
    if (is.bad()) {
        ec = std::make_error_code(std::errc::io_error);
        return std::nullopt;
    }
    return PropertyFileReader(decodeBytes(bytes, charset, sink));
}

std::optional<Entry> PropertyFileReader::readEntry() {
    auto line = lines_.readLogicalLine();
    if (!line)
        return std::nullopt;
    return EntryParser::parse(*line);
}

std::vector<Entry> PropertyFileReader::readAll() {
    std::vector<Entry> entries;
    while (auto entry = readEntry())
        entries.push_back(std::move(*entry));
    return entries;
}

} // namespace PropFile
