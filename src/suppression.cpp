#include "suppression.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ─────────────────────────────────────
PrivacyFilter::PrivacyFilter(std::vector<std::string> keywords) {
    for (std::string &keyword : keywords) {
        keyword = ToLower(std::move(keyword));
        if (!keyword.empty()) {
            m_Keywords.push_back(std::move(keyword));
        }
    }
}

// ─────────────────────────────────────
bool PrivacyFilter::ShouldSuppress(const std::string &domain, const std::string &appName) const {
    if (m_Keywords.empty()) {
        return false;
    }
    const std::string haystack = ToLower(domain + " " + appName);
    return std::any_of(m_Keywords.begin(), m_Keywords.end(), [&](const std::string &keyword) {
        return haystack.find(keyword) != std::string::npos;
    });
}
