#include <propfile/PropertyFile.hpp>
#include <propfile/io/PropertyFileReader.hpp>
#include <propfile/io/PropertyFileWriter.hpp>
#include <propfile/reformatting/Reformatter.hpp>
#include <propfile/util/FileIo.hpp>
#include <propfile/util/FileLockGuard.hpp>
#include <propfile/util/UniqueFd.hpp>
#include <propfile/util/escapeUtil.hpp>

#include <algorithm>
#include <stdexcept>

namespace PropFile {

// =============================================================================
// Construction
// =============================================================================

std::optional<PropertyFile> PropertyFile::fromFile(const std::string& path, std::error_code& ec,
                                                   Charset charset, DiagnosticSink& sink) {
    auto reader = PropertyFileReader::open(path, charset, ec, sink);
    if (!reader)
        return std::nullopt;

    PropertyFile pf(sink);
    while (auto entry = reader->readEntry())
        pf.appendEntry(std::move(*entry));
    return pf;
}

PropertyFile PropertyFile::fromString(std::string text, DiagnosticSink& sink) {
    PropertyFileReader reader(std::move(text));
    PropertyFile pf(sink);
    while (auto entry = reader.readEntry())
        pf.appendEntry(std::move(*entry));
    return pf;
}

PropertyFile PropertyFile::fromBytes(std::string_view bytes, Charset charset,
                                     DiagnosticSink& sink) {
    return fromString(decodeBytes(bytes, charset, sink), sink);
}

std::optional<PropertyFile> PropertyFile::fromStream(std::istream& is, std::error_code& ec,
                                                     Charset charset, DiagnosticSink& sink) {
    auto reader = PropertyFileReader::fromStream(is, charset, ec, sink);
    if (!reader)
        return std::nullopt;

    PropertyFile pf(sink);
    while (auto entry = reader->readEntry())
        pf.appendEntry(std::move(*entry));
    return pf;
}

// =============================================================================
// Arena / index bookkeeping
// =============================================================================

PropertyFile::Handle PropertyFile::allocate(Entry entry) {
    if (!freeSlots_.empty()) {
        const Handle h = freeSlots_.back();
        freeSlots_.pop_back();
        arena_[h] = std::move(entry);
        return h;
    }
    arena_.push_back(std::move(entry));
    return arena_.size() - 1;
}

void PropertyFile::release(Handle handle) {
    arena_[handle] = BasicEntry();
    freeSlots_.push_back(handle);
}

void PropertyFile::indexPut(const std::string& key, Handle handle) {
    // 이미 있는 키는 위치를 유지하고 대상만 바꾼다.
    if (index_.insert_or_assign(key, handle).second)
        keyOrder_.push_back(key);
}

void PropertyFile::indexErase(const std::string& key) {
    if (index_.erase(key) == 0)
        return;
    keyOrder_.erase(std::find(keyOrder_.begin(), keyOrder_.end(), key));
}

void PropertyFile::dropIndexFor(Handle handle) {
    // 보통은 자기 키 하나만 이 핸들을 가리킨다.
    if (const auto* pe = std::get_if<PropertyEntry>(&arena_[handle])) {
        const std::string key = util::unescape(pe->key(), nullDiagnosticSink());
        auto it = index_.find(key);
        if (it != index_.end() && it->second == handle) {
            indexErase(key);
            return;
        }
    }

    std::vector<std::string> stale;
    for (const auto& [key, h] : index_) {
        if (h == handle)
            stale.push_back(key);
    }
    for (const auto& key : stale)
        indexErase(key);
}

// =============================================================================
// Entry sequence
// =============================================================================

void PropertyFile::appendEntry(Entry entry) {
    const Handle h = allocate(std::move(entry));
    order_.push_back(h);

    if (const auto* pe = std::get_if<PropertyEntry>(&arena_[h]))
        indexPut(util::unescape(pe->key(), *sink_), h);
}

void PropertyFile::remove(const Entry& entry) {
    std::vector<Handle> kept;
    kept.reserve(order_.size());
    for (Handle h : order_) {
        if (arena_[h] == entry) {
            dropIndexFor(h);
            release(h);
        } else {
            kept.push_back(h);
        }
    }
    order_.swap(kept);
}

bool PropertyFile::replace(const Entry& oldEntry, Entry newEntry) {
    auto it = std::find_if(order_.begin(), order_.end(),
                           [&](Handle h) { return arena_[h] == oldEntry; });
    if (it == order_.end())
        return false;

    const Handle h = *it;
    dropIndexFor(h);
    arena_[h] = std::move(newEntry);
    if (const auto* pe = std::get_if<PropertyEntry>(&arena_[h]))
        indexPut(util::unescape(pe->key(), *sink_), h);
    return true;
}

std::vector<Entry> PropertyFile::allEntries() const {
    std::vector<Entry> entries;
    entries.reserve(order_.size());
    for (Handle h : order_)
        entries.push_back(arena_[h]);
    return entries;
}

void PropertyFile::clear() noexcept {
    arena_.clear();
    freeSlots_.clear();
    order_.clear();
    index_.clear();
    keyOrder_.clear();
}

void PropertyFile::setEntries(const std::vector<Entry>& entries) {
    clear();
    for (const auto& entry : entries)
        appendEntry(entry);
}

void PropertyFile::reorder(const std::vector<size_t>& newOrder) {
    if (newOrder.size() != order_.size())
        throw std::invalid_argument("reorder: permutation size does not match entry count");

    std::vector<bool> seen(order_.size(), false);
    std::vector<Handle> reordered;
    reordered.reserve(order_.size());
    for (size_t pos : newOrder) {
        if (pos >= order_.size() || seen[pos])
            throw std::invalid_argument("reorder: not a permutation");
        seen[pos] = true;
        reordered.push_back(order_[pos]);
    }
    order_.swap(reordered);
}

// =============================================================================
// Key/value access
// =============================================================================

void PropertyFile::set(const std::string& key, const std::string& value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        // 기존 항목은 값만 바꿔 서식과 위치를 유지한다.
        std::get<PropertyEntry>(arena_[it->second]).setValue(util::escapeValue(value));
        return;
    }

    const Handle h = allocate(PropertyEntry(util::escapeKey(key), util::escapeValue(value)));
    order_.push_back(h);
    indexPut(key, h);
}

std::optional<std::string> PropertyFile::get(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end())
        return std::nullopt;
    return util::unescape(std::get<PropertyEntry>(arena_[it->second]).value(), *sink_);
}

std::optional<PropertyEntry> PropertyFile::getPropertyEntry(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end())
        return std::nullopt;
    return std::get<PropertyEntry>(arena_[it->second]);
}

void PropertyFile::remove(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end())
        return;

    const Handle h = it->second;
    indexErase(key);
    order_.erase(std::find(order_.begin(), order_.end(), h));
    release(h);
}

std::vector<std::string> PropertyFile::values() const {
    std::vector<std::string> out;
    out.reserve(keyOrder_.size());
    for (const auto& key : keyOrder_)
        out.push_back(util::unescape(std::get<PropertyEntry>(arena_[index_.at(key)]).value(),
                                     *sink_));
    return out;
}

std::map<std::string, std::string> PropertyFile::toMap() const {
    std::map<std::string, std::string> out;
    for (const auto& [key, h] : index_)
        out.emplace(key, util::unescape(std::get<PropertyEntry>(arena_[h]).value(), *sink_));
    return out;
}

// =============================================================================
// Output
// =============================================================================

void PropertyFile::mergeInto(PropertyFile& target, MissingKeyAction action) const {
    for (Handle h : order_) {
        const auto* pe = std::get_if<PropertyEntry>(&arena_[h]);
        if (!pe)
            continue;

        const std::string key = util::unescape(pe->key(), *sink_);
        auto it = target.index_.find(key);
        if (it == target.index_.end()) {
            target.appendEntry(*pe);
            continue;
        }

        // 이스케이프 표기만 다른 값은 다시 쓰지 않는다.
        auto& existing = std::get<PropertyEntry>(target.arena_[it->second]);
        if (util::unescape(existing.value(), *sink_) != util::unescape(pe->value(), *sink_))
            existing.setValue(pe->value());
    }

    std::vector<std::string> missing;
    for (const auto& key : target.keyOrder_) {
        if (!containsKey(key))
            missing.push_back(key);
    }

    switch (action) {
    case MissingKeyAction::Nothing:
        break;
    case MissingKeyAction::Delete:
        for (const auto& key : missing)
            target.remove(key);
        break;
    case MissingKeyAction::Comment:
        for (const auto& key : missing) {
            const Handle h = target.index_.at(key);
            const std::string commented = util::commentOut(PropFile::toText(target.arena_[h]));
            target.dropIndexFor(h);
            target.arena_[h] = BasicEntry(commented);
        }
        break;
    }
}

bool PropertyFile::saveTo(const std::string& path, const Options& options,
                          std::error_code& ec) const {
    if (detail::fileExists(path))
        return update(path, options, ec);
    return overwrite(path, options, ec);
}

bool PropertyFile::update(const std::string& path, const Options& options,
                          std::error_code& ec) const {
    detail::UniqueFd fd = detail::UniqueFd::open(path, O_RDWR, ec);
    if (ec)
        return false;

    bool ok = false;
    {
        // 읽기부터 다시 쓰기까지 같은 fd에서 배타 잠금을 유지한다.
        detail::FileLockGuard lock(fd.get(), detail::FileLockGuard::Mode::Exclusive, ec);
        std::string bytes;
        if (!ec && detail::readAll(fd.get(), bytes, ec)) {
            PropertyFile existing = fromBytes(bytes, options.charset(), *sink_);
            mergeInto(existing, options.missingKeyAction());

            PropertyFileWriter writer(options, *sink_);
            writer.writeEntries(existing.allEntries());
            ok = writer.writeTo(fd.get(), ec);
        }

        std::error_code unlockEc;
        if (lock.locked() && !lock.unlock(unlockEc))
            sink_->report(Severity::Warning, "Error unlocking " + path + ": " + unlockEc.message());
    }

    detail::closeReporting(fd, path, *sink_);
    return ok;
}

bool PropertyFile::overwrite(const std::string& path, const Options& options,
                             std::error_code& ec) const {
    PropertyFileWriter writer(options.with(UnicodeHandling::ByCharset), *sink_);
    writer.writeEntries(allEntries());
    return writer.writeToFile(path, true, ec);
}

bool PropertyFile::overwrite(std::ostream& os, const Options& options,
                             std::error_code& ec) const {
    PropertyFileWriter writer(options, *sink_);
    writer.writeEntries(allEntries());
    return writer.writeTo(os, ec);
}

std::string PropertyFile::toString(const Options& options) const {
    PropertyFileWriter writer(options, *sink_);
    writer.writeEntries(allEntries());
    return writer.encoded();
}

std::string PropertyFile::toText() const {
    std::string out;
    for (Handle h : order_)
        out += PropFile::toText(arena_[h]);
    return out;
}

// =============================================================================
// Reformatting
// =============================================================================

bool PropertyFile::reformat(std::error_code& ec) {
    return Reformatter(ReformatOptions(), *sink_).reformat(*this, ec);
}

bool PropertyFile::reformat(const ReformatOptions& options, std::error_code& ec) {
    return Reformatter(options, *sink_).reformat(*this, ec);
}

void PropertyFile::reorderByKey() {
    Reformatter(ReformatOptions(), *sink_).reorderByKey(*this);
}

void PropertyFile::reorderByKey(const ReformatOptions& options) {
    Reformatter(options, *sink_).reorderByKey(*this);
}

void PropertyFile::reorderByTemplate(const PropertyFile& reference) {
    Reformatter(ReformatOptions(), *sink_).reorderByTemplate(reference, *this);
}

void PropertyFile::reorderByTemplate(const PropertyFile& reference,
                                     const ReformatOptions& options) {
    Reformatter(options, *sink_).reorderByTemplate(reference, *this);
}

// =============================================================================
// Equality
// =============================================================================

bool PropertyFile::operator==(const PropertyFile& other) const {
    if (order_.size() != other.order_.size())
        return false;
    for (size_t i = 0; i < order_.size(); ++i) {
        if (arena_[order_[i]] != other.arena_[other.order_[i]])
            return false;
    }
    return true;
}

} // namespace PropFile
