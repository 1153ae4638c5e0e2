/// @file resource_pattern.cpp
/// @brief Resource pattern matching.

#include "agw/service/resource_pattern.hpp"

namespace agw::service {

namespace {

bool isGlob(std::string_view pattern) {
    return !pattern.empty() && pattern.back() == '*';
}

}  // namespace

bool isValidPattern(std::string_view pattern) {
    if (pattern.empty()) {
        return false;
    }
    auto star = pattern.find('*');
    return star == std::string_view::npos || star == pattern.size() - 1;
}

bool matchesPattern(std::string_view pattern, std::string_view resource) {
    if (!isGlob(pattern)) {
        return pattern == resource;
    }
    auto prefix = pattern.substr(0, pattern.size() - 1);
    return resource.substr(0, prefix.size()) == prefix;
}

std::size_t patternSpecificity(std::string_view pattern) {
    if (!isGlob(pattern)) {
        // Exact match beats any prefix.
        return static_cast<std::size_t>(-1);
    }
    return pattern.size() - 1;
}

}  // namespace agw::service
