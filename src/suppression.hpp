#pragma once

#include <string>
#include <vector>

// Masks activities whose domain or app name contains an excluded keyword.
// Suppressed time is counted as neutral and the name never reaches a ranking.
class PrivacyFilter {
  public:
    PrivacyFilter() = default;
    explicit PrivacyFilter(std::vector<std::string> keywords);

    bool ShouldSuppress(const std::string &domain, const std::string &appName) const;
    bool Empty() const {
        return m_Keywords.empty();
    }

  private:
    std::vector<std::string> m_Keywords; // lower-cased, non-empty
};
