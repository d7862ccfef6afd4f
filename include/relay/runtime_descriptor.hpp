#pragma once

#include "relay/platform.hpp"

#include <optional>
#include <string>

namespace relay {

// ============================================================================
// Runtime Descriptor
// ============================================================================
//
// A running application instance advertises itself in a small JSON file:
//
//   { "host": "127.0.0.1", "port": 8765, "token": "...", "pid": 4242 }
//
// relay only reads it. The file outlives crashed instances, so its contents
// are a claim to be checked with a ping, never a fact.

constexpr const char* kRuntimeDescriptorName = "runtime.json";
constexpr const char* kDefaultRuntimeHost = "127.0.0.1";

struct RuntimeDescriptor {
    std::string host = kDefaultRuntimeHost;
    int port = 0;
    std::string token;          // empty: no authenticated control
    ProcessId pid = 0;          // 0: unknown

    // "http://host:port"
    std::string base_url() const;
};

struct RuntimeDescriptorParseResult {
    bool ok = false;
    std::string error;
    RuntimeDescriptor descriptor;
};

RuntimeDescriptorParseResult parse_runtime_descriptor(const std::string& json_text);

// nullopt when the file is missing, unreadable or invalid
std::optional<RuntimeDescriptor> read_runtime_descriptor(const std::string& path);

} // namespace relay
