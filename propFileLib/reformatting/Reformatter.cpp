#include <propfile/io/PropertyFileWriter.hpp>
#include <propfile/reformatting/OrderableEntry.hpp>
#include <propfile/reformatting/Reformatter.hpp>
#include <propfile/util/escapeUtil.hpp>

#include <algorithm>
#include <iterator>

namespace PropFile {

namespace {

std::string stripLineBreaks(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!util::isLineBreak(c))
            out += c;
    }
    return out;
}

} // namespace

bool Reformatter::reformat(PropertyFile& file, const ReformatOptions& options,
                           std::error_code& ec) const {
    PropertyFormat format;
    if (!parseFormat(options.format(), format, ec, *sink_))
        return false;

    std::vector<Entry> formatted;
    formatted.reserve(file.entriesSize());
    for (size_t i = 0; i < file.entriesSize(); ++i) {
        const Entry& entry = file.entryAt(i);
        if (const auto* pe = std::get_if<PropertyEntry>(&entry)) {
            std::string key = pe->key();
            std::string value = pe->value();
            if (options.reformatKeyAndValue()) {
                key = util::escapeKey(util::unescape(key, *sink_));
                value = util::escapeValue(util::unescape(value, *sink_));
            }
            formatted.emplace_back(PropertyEntry(format.leadingWhitespace, std::move(key),
                                                 format.separator, std::move(value),
                                                 format.lineEnding));
        } else {
            const auto& be = std::get<BasicEntry>(entry);
            formatted.emplace_back(BasicEntry(stripLineBreaks(be.toText()) + format.lineEnding));
        }
    }

    file.setEntries(formatted);
    return true;
}

bool Reformatter::reformat(const std::string& path, const ReformatOptions& options,
                           std::error_code& ec) const {
    auto file = PropertyFile::fromFile(path, ec, options.charset(), *sink_);
    if (!file)
        return false;
    if (!reformat(*file, options, ec))
        return false;
    return writeBack(*file, path, options, ec);
}

void Reformatter::reorderByKey(PropertyFile& file, const ReformatOptions& options) const {
    auto groups = groupEntries(file.allEntries(), options.attachCommentsTo());
    sortGroupsByKey(groups, options.attachCommentsTo());
    file.reorder(positionsOf(groups));
}

bool Reformatter::reorderByKey(const std::string& path, const ReformatOptions& options,
                               std::error_code& ec) const {
    auto file = PropertyFile::fromFile(path, ec, options.charset(), *sink_);
    if (!file)
        return false;
    reorderByKey(*file, options);
    return writeBack(*file, path, options, ec);
}

void Reformatter::reorderByTemplate(const PropertyFile& reference, PropertyFile& file,
                                    const ReformatOptions& options) const {
    auto groups = groupEntries(file.allEntries(), options.attachCommentsTo());

    std::vector<OrderableEntry> ordered;
    for (size_t i = 0; i < reference.entriesSize(); ++i) {
        const auto* pe = std::get_if<PropertyEntry>(&reference.entryAt(i));
        if (!pe)
            continue;
        if (auto group = popGroup(groups, pe->key()))
            ordered.push_back(std::move(*group));
    }

    // 템플릿에 없는 그룹은 원래 순서대로 뒤에 붙인다.
    std::move(groups.begin(), groups.end(), std::back_inserter(ordered));
    file.reorder(positionsOf(ordered));
}

bool Reformatter::reorderByTemplate(const PropertyFile& reference, const std::string& path,
                                    const ReformatOptions& options, std::error_code& ec) const {
    auto file = PropertyFile::fromFile(path, ec, options.charset(), *sink_);
    if (!file)
        return false;
    reorderByTemplate(reference, *file, options);
    return writeBack(*file, path, options, ec);
}

bool Reformatter::reorderByTemplate(const std::string& templatePath, Charset templateCharset,
                                    const std::string& path, const ReformatOptions& options,
                                    std::error_code& ec) const {
    auto reference = PropertyFile::fromFile(templatePath, ec, templateCharset, *sink_);
    if (!reference)
        return false;
    return reorderByTemplate(*reference, path, options, ec);
}

bool Reformatter::writeBack(const PropertyFile& file, const std::string& path,
                            const ReformatOptions& options, std::error_code& ec) const {
    PropertyFileWriter writer(Options().with(options.charset()).with(options.unicodeHandling()),
                              *sink_);
    writer.writeEntries(file.allEntries());
    return writer.writeToFile(path, false, ec);
}

} // namespace PropFile
