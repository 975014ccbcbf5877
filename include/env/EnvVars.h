//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read mcp-agent configuration from environment variables.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

//==========================================================================================================
// Known configuration variables. Programmatic setters on the owning objects take precedence.
//==========================================================================================================
namespace EnvNames {
    constexpr const char* LogLevel = "MCPAGENT_LOG_LEVEL";
    constexpr const char* LogColor = "MCPAGENT_LOG_COLOR";
    constexpr const char* LogStderr = "MCPAGENT_LOG_STDERR";
    constexpr const char* LogFile = "MCPAGENT_LOG_FILE";
    constexpr const char* RequestTimeoutMs = "MCPAGENT_REQUEST_TIMEOUT_MS";
    constexpr const char* ProviderTimeoutMs = "MCPAGENT_PROVIDER_TIMEOUT_MS";
    constexpr const char* TerminateGraceMs = "MCPAGENT_TERMINATE_GRACE_MS";
}

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Reads a boolean switch ("1"/"true"/"TRUE" are true, anything else false).
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue ? "1" : "0");
    return (v == "1" || v == "true" || v == "TRUE");
}

//==========================================================================================================
// ParseUInt64
// Purpose: Parses a decimal unsigned value; std::nullopt when the text is empty, signed, or malformed.
//==========================================================================================================
inline std::optional<uint64_t> ParseUInt64(const std::string& text) {
    if (text.empty() || text.front() == '-' || text.front() == '+') {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(v);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

//==========================================================================================================
// GetEnvUInt64OrDefault
// Purpose: Reads a numeric variable such as a timeout in milliseconds.
// Returns:
//   The parsed value, or defaultValue when unset or malformed.
//==========================================================================================================
inline uint64_t GetEnvUInt64OrDefault(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    return ParseUInt64(v).value_or(defaultValue);
}
