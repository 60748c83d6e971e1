#include "common.hpp"

// ─────────────────────────────────────
const char *CategoryName(Category category) {
    switch (category) {
    case PRODUCTIVE:
        return "productive";
    case NEUTRAL:
        return "neutral";
    case FRIVOLITY:
        return "frivolity";
    case DRAINING:
        return "draining";
    case EMERGENCY:
        return "emergency";
    }
    return "neutral";
}

// ─────────────────────────────────────
std::optional<Category> ParseCategory(const std::string &name) {
    if (name == "productive") {
        return PRODUCTIVE;
    }
    if (name == "neutral") {
        return NEUTRAL;
    }
    if (name == "frivolity") {
        return FRIVOLITY;
    }
    if (name == "draining") {
        return DRAINING;
    }
    if (name == "emergency") {
        return EMERGENCY;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::string ActivityInterval::Label() const {
    if (!domain.empty()) {
        return domain;
    }
    if (!app_name.empty()) {
        return app_name;
    }
    return "Unknown";
}
