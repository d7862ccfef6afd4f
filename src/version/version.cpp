#include "relay/version.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace relay {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

// Split string by delimiter, preserving empty parts
std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(delim, start)) != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

bool parse_segment(const std::string& segment, std::uint64_t& out) {
    if (segment.empty()) return false;

    constexpr auto max = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (char c : segment) {
        if (c < '0' || c > '9') return false;
        auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (max - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // namespace

VersionSegments parse_version_segments(const std::string& version) {
    VersionSegments segments;

    for (const auto& part : split(trim(version), '.')) {
        std::uint64_t value = 0;
        if (parse_segment(trim(part), value)) {
            segments.push_back(value);
        }
    }

    while (!segments.empty() && segments.back() == 0) {
        segments.pop_back();
    }

    return segments;
}

int compare_versions(const std::string& a, const std::string& b) {
    auto lhs = parse_version_segments(a);
    auto rhs = parse_version_segments(b);

    if (std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end())) {
        return -1;
    }
    if (std::lexicographical_compare(rhs.begin(), rhs.end(), lhs.begin(), lhs.end())) {
        return 1;
    }
    return 0;
}

bool is_newer(const std::string& a, const std::string& b) {
    return compare_versions(a, b) > 0;
}

bool same_version(const std::string& a, const std::string& b) {
    return compare_versions(a, b) == 0;
}

} // namespace relay
