#include "version.hpp"

#include <cctype>

namespace dockapi {

namespace {

int parseComponent(const std::string& text, std::size_t begin, std::size_t end) {
    if (begin >= end) return 0;

    int value = 0;
    for (std::size_t i = begin; i < end; ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(ch)) return 0;
        value = value * 10 + (ch - '0');
        if (value > 1000000) return 0;
    }
    return value;
}

} // namespace

std::string normalizeVersion(const std::string& text) {
    if (!text.empty() && text[0] == 'v') {
        return text.substr(1);
    }
    return text;
}

ApiVersion::ApiVersion(const std::string& text)
    : mText(normalizeVersion(text))
{
    const auto dot = mText.find('.');
    if (dot == std::string::npos) {
        mMajor = parseComponent(mText, 0, mText.size());
        return;
    }

    const auto next = mText.find('.', dot + 1);
    mMajor = parseComponent(mText, 0, dot);
    mMinor = parseComponent(mText, dot + 1,
                            next == std::string::npos ? mText.size() : next);
}

bool operator<(const ApiVersion& a, const ApiVersion& b) {
    if (a.mMajor != b.mMajor) return a.mMajor < b.mMajor;
    return a.mMinor < b.mMinor;
}

bool operator==(const ApiVersion& a, const ApiVersion& b) {
    return a.mMajor == b.mMajor && a.mMinor == b.mMinor;
}

} // namespace dockapi
