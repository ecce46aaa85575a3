#include <propfile/reformatting/ReformatOptions.hpp>

namespace PropFile {

std::string ReformatOptions::toString() const {
    return std::string("ReformatOptions{charset=") + charsetName(charset_) +
           ", unicodeHandling=" + PropFile::toString(unicodeHandling_) + ", format=" + format_ +
           ", reformatKeyAndValue=" + (reformatKeyAndValue_ ? "true" : "false") +
           ", attachCommentsTo=" + PropFile::toString(attachCommentsTo_) + "}";
}

} // namespace PropFile
