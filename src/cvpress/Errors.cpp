#include "cvpress/Errors.hpp"

namespace cvpress {

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += names[i];
    }
    return out;
}

UnknownFormatError::UnknownFormatError(const std::string& format, const std::vector<std::string>& available)
    : Error("unknown format '" + format + "' (available: " + join_names(available) + ")"),
      format_(format) {}

UnknownThemeError::UnknownThemeError(const std::string& theme, const std::vector<std::string>& available)
    : Error("unknown theme '" + theme + "' (available: " + join_names(available) + ")"),
      theme_(theme) {}

}  // namespace cvpress
