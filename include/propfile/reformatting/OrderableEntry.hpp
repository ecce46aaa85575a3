#pragma once
/// @file OrderableEntry.hpp
/// @brief Groups of entries that move together when a document is reordered

#include <propfile/entry/Entry.hpp>
#include <propfile/reformatting/AttachCommentsTo.hpp>

#include <optional>
#include <string>
#include <vector>

namespace PropFile {

/// @brief A run of consecutive entries holding at most one PropertyEntry
class OrderableEntry {
  public:
    /// @param entries Consecutive entries of the group, in document order
    /// @param firstPosition Document position of entries.front()
    /// @throws std::invalid_argument if @p entries is empty
    /// @throws std::logic_error if @p entries holds more than one PropertyEntry
    OrderableEntry(std::vector<Entry> entries, size_t firstPosition);

    bool hasPropertyEntry() const noexcept { return propertyIndex_ >= 0; }

    /// @brief The group's PropertyEntry; only valid if hasPropertyEntry()
    const PropertyEntry& propertyEntry() const;

    const std::vector<Entry>& entries() const noexcept { return entries_; }

    size_t firstPosition() const noexcept { return firstPosition_; }

    size_t size() const noexcept { return entries_.size(); }

  private:
    std::vector<Entry> entries_;
    size_t firstPosition_;
    int propertyIndex_ = -1;
};

/// @brief Split a document into groups according to @p policy
///
/// Groups are returned in document order and cover every entry exactly once.
std::vector<OrderableEntry> groupEntries(const std::vector<Entry>& entries,
                                         AttachCommentsTo policy);

/// @brief Sort groups by escaped key (byte-wise, stable)
///
/// Groups without a key go last for NextProperty and first for
/// PrevProperty. With OrigLine only the property groups move, through the
/// positions property groups occupied before.
void sortGroupsByKey(std::vector<OrderableEntry>& groups, AttachCommentsTo policy);

/// @brief Remove and return the first group whose escaped key is @p escapedKey
std::optional<OrderableEntry> popGroup(std::vector<OrderableEntry>& groups,
                                       const std::string& escapedKey);

/// @brief Document positions of the grouped entries, in group order
std::vector<size_t> positionsOf(const std::vector<OrderableEntry>& groups);

} // namespace PropFile
