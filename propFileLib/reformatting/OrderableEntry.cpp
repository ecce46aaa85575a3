#include <propfile/reformatting/OrderableEntry.hpp>

#include <algorithm>
#include <stdexcept>

namespace PropFile {

OrderableEntry::OrderableEntry(std::vector<Entry> entries, size_t firstPosition)
    : entries_(std::move(entries)), firstPosition_(firstPosition) {
    if (entries_.empty())
        throw std::invalid_argument("OrderableEntry: the list of entries may not be empty");

    for (size_t i = 0; i < entries_.size(); ++i) {
        if (!isPropertyEntry(entries_[i]))
            continue;
        if (propertyIndex_ >= 0)
            throw std::logic_error("OrderableEntry: at most one PropertyEntry is allowed");
        propertyIndex_ = static_cast<int>(i);
    }
}

const PropertyEntry& OrderableEntry::propertyEntry() const {
    if (propertyIndex_ < 0)
        throw std::logic_error("OrderableEntry: group has no PropertyEntry");
    return std::get<PropertyEntry>(entries_[static_cast<size_t>(propertyIndex_)]);
}

namespace {

// NEXT: 주석은 뒤따르는 property와 묶인다.
std::vector<OrderableEntry> groupWithNext(const std::vector<Entry>& entries) {
    std::vector<OrderableEntry> groups;
    std::vector<Entry> buffer;
    size_t start = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        buffer.push_back(entries[i]);
        if (isPropertyEntry(entries[i])) {
            groups.emplace_back(std::move(buffer), start);
            buffer.clear();
            start = i + 1;
        }
    }
    if (!buffer.empty())
        groups.emplace_back(std::move(buffer), start);
    return groups;
}

// PREV: 주석은 앞선 property와 묶인다.
std::vector<OrderableEntry> groupWithPrev(const std::vector<Entry>& entries) {
    std::vector<OrderableEntry> groups;
    std::vector<Entry> buffer;
    size_t start = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (isPropertyEntry(entries[i]) && !buffer.empty()) {
            groups.emplace_back(std::move(buffer), start);
            buffer.clear();
            start = i;
        }
        buffer.push_back(entries[i]);
    }
    if (!buffer.empty())
        groups.emplace_back(std::move(buffer), start);
    return groups;
}

std::vector<OrderableEntry> groupSingletons(const std::vector<Entry>& entries) {
    std::vector<OrderableEntry> groups;
    groups.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i)
        groups.emplace_back(std::vector<Entry>{entries[i]}, i);
    return groups;
}

bool keyLess(const OrderableEntry& a, const OrderableEntry& b) {
    return a.propertyEntry().key() < b.propertyEntry().key();
}

} // namespace

std::vector<OrderableEntry> groupEntries(const std::vector<Entry>& entries,
                                         AttachCommentsTo policy) {
    switch (policy) {
    case AttachCommentsTo::NextProperty:
        return groupWithNext(entries);
    case AttachCommentsTo::PrevProperty:
        return groupWithPrev(entries);
    case AttachCommentsTo::OrigLine:
        return groupSingletons(entries);
    }
    throw std::logic_error("groupEntries: unknown AttachCommentsTo value");
}

void sortGroupsByKey(std::vector<OrderableEntry>& groups, AttachCommentsTo policy) {
    switch (policy) {
    case AttachCommentsTo::NextProperty:
        std::stable_sort(groups.begin(), groups.end(),
                         [](const OrderableEntry& a, const OrderableEntry& b) {
                             if (!a.hasPropertyEntry() || !b.hasPropertyEntry())
                                 return a.hasPropertyEntry() && !b.hasPropertyEntry();
                             return keyLess(a, b);
                         });
        return;
    case AttachCommentsTo::PrevProperty:
        std::stable_sort(groups.begin(), groups.end(),
                         [](const OrderableEntry& a, const OrderableEntry& b) {
                             if (!a.hasPropertyEntry() || !b.hasPropertyEntry())
                                 return !a.hasPropertyEntry() && b.hasPropertyEntry();
                             return keyLess(a, b);
                         });
        return;
    case AttachCommentsTo::OrigLine: {
        // property 그룹만 정렬해서 원래 property 자리에 차례로 다시 넣는다.
        std::vector<OrderableEntry> sorted;
        for (const auto& group : groups) {
            if (group.hasPropertyEntry())
                sorted.push_back(group);
        }
        std::stable_sort(sorted.begin(), sorted.end(), keyLess);

        auto next = sorted.begin();
        for (auto& group : groups) {
            if (group.hasPropertyEntry())
                group = *next++;
        }
        return;
    }
    }
    throw std::logic_error("sortGroupsByKey: unknown AttachCommentsTo value");
}

std::optional<OrderableEntry> popGroup(std::vector<OrderableEntry>& groups,
                                       const std::string& escapedKey) {
    auto it = std::find_if(groups.begin(), groups.end(), [&](const OrderableEntry& group) {
        return group.hasPropertyEntry() && group.propertyEntry().key() == escapedKey;
    });
    if (it == groups.end())
        return std::nullopt;

    OrderableEntry popped = std::move(*it);
    groups.erase(it);
    return popped;
}

std::vector<size_t> positionsOf(const std::vector<OrderableEntry>& groups) {
    std::vector<size_t> positions;
    for (const auto& group : groups) {
        for (size_t i = 0; i < group.size(); ++i)
            positions.push_back(group.firstPosition() + i);
    }
    return positions;
}

} // namespace PropFile
