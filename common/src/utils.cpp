#include "lb/common/utils.h"

std::vector<std::string_view> lb::utils::split_by(std::string_view str, char delim) {
    std::vector<std::string_view> out;
    size_t seek = 0;
    while (seek <= str.length()) {
        size_t end = str.find(delim, seek);
        if (end == std::string_view::npos) {
            end = str.length();
        }
        std::string_view s = str.substr(seek, end - seek);
        trim(s);
        if (!s.empty()) {
            out.push_back(s);
        }
        seek = end + 1;
    }
    return out;
}

std::string lb::utils::normalize_domain(std::string_view domain) {
    trim(domain);
    while (!domain.empty() && domain.back() == '.') {
        domain.remove_suffix(1);
    }
    std::string normalized = to_lower(domain);
    normalized.push_back('.');
    return normalized;
}

bool lb::utils::is_subdomain_or_same(std::string_view domain, std::string_view suffix) {
    if (suffix == ".") {
        return true;
    }
    if (!ends_with(domain, suffix)) {
        return false;
    }
    return domain.length() == suffix.length() || domain[domain.length() - suffix.length() - 1] == '.';
}
