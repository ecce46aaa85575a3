#include <propfile/util/Errors.hpp>

namespace PropFile {

namespace {

class PropfileCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "propfile"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
        case Errc::InvalidFormat:
            return "invalid format string";
        case Errc::UnsupportedCharset:
            return "unsupported charset";
        }
        return "unknown propfile error";
    }
};

} // namespace

const std::error_category& propfileCategory() noexcept {
    static const PropfileCategory category;
    return category;
}

} // namespace PropFile
