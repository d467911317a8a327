#include "huginn/duplicate_filter.h"
#include <cctype>

namespace huginn {

DuplicateFilter::DuplicateFilter(std::chrono::milliseconds window)
    : window_(window)
{
}

std::string DuplicateFilter::normalize(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    for (size_t i = 0; i < text.size(); i++) {
        unsigned char uc = static_cast<unsigned char>(text[i]);
        if (std::isspace(uc)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }

        // Latin-1 capitals U+00C0-U+00DE (except U+00D7) are C3 80-9E; lowercase is +0x20
        if (uc == 0xC3 && i + 1 < text.size()) {
            unsigned char next = static_cast<unsigned char>(text[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                next = static_cast<unsigned char>(next + 0x20);
            }
            result += text[i];
            result += static_cast<char>(next);
            i++;
            continue;
        }

        // Other non-ASCII bytes are kept as-is
        result += (uc < 0x80) ? static_cast<char>(std::tolower(uc)) : text[i];
    }

    return result;
}

bool DuplicateFilter::accept(const std::string& text, TimePoint now) {
    std::string normalized = normalize(text);
    if (normalized.empty()) {
        return false;
    }

    if (has_last_ && normalized == last_text_ && now - last_time_ < window_) {
        return false;
    }

    last_text_ = std::move(normalized);
    last_time_ = now;
    has_last_ = true;
    return true;
}

void DuplicateFilter::reset() {
    last_text_.clear();
    last_time_ = TimePoint{};
    has_last_ = false;
}

} // namespace huginn
