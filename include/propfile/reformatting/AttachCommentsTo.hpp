#pragma once
/// @file AttachCommentsTo.hpp
/// @brief Policy for keeping comments and blank lines with properties when reordering

namespace PropFile {

enum class AttachCommentsTo {
    NextProperty, ///< Comment lines travel with the property that follows them
    PrevProperty, ///< Comment lines travel with the property that precedes them
    OrigLine      ///< Comment lines stay at their original position
};

inline const char* toString(AttachCommentsTo policy) noexcept {
    switch (policy) {
    case AttachCommentsTo::NextProperty:
        return "NEXT_PROPERTY";
    case AttachCommentsTo::PrevProperty:
        return "PREV_PROPERTY";
    case AttachCommentsTo::OrigLine:
        return "ORIG_LINE";
    }
    return "UNKNOWN";
}

} // namespace PropFile
