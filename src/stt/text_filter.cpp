#include "stt/text_filter.hpp"
#include "core/log.hpp"

#include <cctype>

// Constructor
TextFilter::TextFilter(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        try {
            patterns_.emplace_back(p, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            logWarn("Text Filter", "skipping invalid pattern '" + p + "': " + e.what());
        }
    }
}

std::string TextFilter::apply(const std::string& text) const {
    std::string out = text;
    for (const auto& re : patterns_) out = std::regex_replace(out, re, "");
    return out;
}

std::string trimLeft(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isspace((unsigned char)text[i])) ++i;
    return text.substr(i);
}
