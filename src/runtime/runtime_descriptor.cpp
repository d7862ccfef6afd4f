#include "relay/runtime_descriptor.hpp"

#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace relay {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Integer value, also accepting numeric strings
std::optional<long long> get_integer(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) return std::nullopt;
    const auto& v = j[key];
    if (v.is_number_integer()) {
        return v.get<long long>();
    }
    if (v.is_string()) {
        std::string s = trim(v.get<std::string>());
        if (s.empty()) return std::nullopt;
        long long value = 0;
        for (char c : s) {
            if (c < '0' || c > '9') return std::nullopt;
            value = value * 10 + (c - '0');
            if (value > 0x7FFFFFFFLL) return std::nullopt;
        }
        return value;
    }
    return std::nullopt;
}

} // namespace

std::string RuntimeDescriptor::base_url() const {
    std::string h = host;
    // Bare IPv6 literal
    if (h.find(':') != std::string::npos && h.front() != '[') {
        h = "[" + h + "]";
    }
    return "http://" + h + ":" + std::to_string(port);
}

RuntimeDescriptorParseResult parse_runtime_descriptor(const std::string& json_text) {
    RuntimeDescriptorParseResult result;

    std::string text = json_text;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("malformed runtime descriptor: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "runtime descriptor must be a JSON object";
        return result;
    }

    if (j.contains("host") && j["host"].is_string()) {
        std::string host = trim(j["host"].get<std::string>());
        if (!host.empty()) {
            result.descriptor.host = host;
        }
    }

    auto port = get_integer(j, "port");
    if (!port || *port < 1 || *port > 65535) {
        result.error = "runtime descriptor has no valid port";
        return result;
    }
    result.descriptor.port = static_cast<int>(*port);

    if (j.contains("token") && j["token"].is_string()) {
        result.descriptor.token = trim(j["token"].get<std::string>());
    }

    if (auto pid = get_integer(j, "pid")) {
        if (*pid > 0) {
            result.descriptor.pid = static_cast<ProcessId>(*pid);
        }
    }

    result.ok = true;
    return result;
}

std::optional<RuntimeDescriptor> read_runtime_descriptor(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return std::nullopt;
    }

    auto parsed = parse_runtime_descriptor(*content);
    if (!parsed.ok) {
        spdlog::warn("ignoring runtime descriptor {}: {}", path, parsed.error);
        return std::nullopt;
    }

    return parsed.descriptor;
}

} // namespace relay
