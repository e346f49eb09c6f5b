#ifndef TEXT_FILTER_HPP
#define TEXT_FILTER_HPP

#include <regex>
#include <string>
#include <vector>

// Removes known model hallucinations (stock subtitle credits and the like)
// from transcribed text.
class TextFilter {
public:
    // Invalid patterns are reported and skipped.
    explicit TextFilter(const std::vector<std::string>& patterns);

    std::string apply(const std::string& text) const;

    size_t size() const { return patterns_.size(); }

private:
    std::vector<std::regex> patterns_;
};

// Strips leading whitespace (whisper prefixes each segment with a space).
std::string trimLeft(const std::string& text);

#endif
