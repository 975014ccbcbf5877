//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: tools/list and resources/list result shapes
//==========================================================================================================

#include "mcpagent/Protocol.h"

namespace mcpagent {

namespace {
std::optional<std::string> readCursor(const JSONValue& result) {
    const JSONValue* c = result.find("nextCursor");
    if (!c) {
        return std::nullopt;
    }
    if (c->isString()) {
        const auto& s = std::get<std::string>(c->value);
        if (s.empty()) {
            return std::nullopt;
        }
        return s;
    }
    if (std::holds_alternative<int64_t>(c->value)) {
        return std::to_string(std::get<int64_t>(c->value));
    }
    return std::nullopt;
}

std::optional<std::string> optionalString(const JSONValue& item, const std::string& key) {
    const JSONValue* v = item.find(key);
    if (v && v->isString()) {
        return std::get<std::string>(v->value);
    }
    return std::nullopt;
}
} // namespace

ToolsListResult ParseToolsListResult(const JSONValue& result) {
    ToolsListResult out;
    const JSONValue* arr = result.find("tools");
    if (arr && arr->isArray()) {
        for (const auto& itemPtr : std::get<JSONValue::Array>(arr->value)) {
            if (!itemPtr || !itemPtr->isObject()) continue;
            Tool tool;
            tool.name = itemPtr->stringOr("name", "");
            tool.description = itemPtr->stringOr("description", "");
            const JSONValue* schema = itemPtr->find("inputSchema");
            tool.inputSchema = schema ? *schema : JSONValue{JSONValue::Object{}};
            out.tools.push_back(std::move(tool));
        }
    }
    out.nextCursor = readCursor(result);
    return out;
}

ResourcesListResult ParseResourcesListResult(const JSONValue& result) {
    ResourcesListResult out;
    const JSONValue* arr = result.find("resources");
    if (arr && arr->isArray()) {
        for (const auto& itemPtr : std::get<JSONValue::Array>(arr->value)) {
            if (!itemPtr || !itemPtr->isObject()) continue;
            Resource r;
            r.uri = itemPtr->stringOr("uri", "");
            r.name = itemPtr->stringOr("name", "");
            r.description = optionalString(*itemPtr, "description");
            r.mimeType = optionalString(*itemPtr, "mimeType");
            out.resources.push_back(std::move(r));
        }
    }
    out.nextCursor = readCursor(result);
    return out;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    return JSONValue{std::move(obj)};
}

JSONValue ResourceToJSON(const Resource& resource) {
    JSONValue::Object obj;
    obj["uri"] = std::make_shared<JSONValue>(resource.uri);
    obj["name"] = std::make_shared<JSONValue>(resource.name);
    if (resource.description.has_value()) {
        obj["description"] = std::make_shared<JSONValue>(resource.description.value());
    }
    if (resource.mimeType.has_value()) {
        obj["mimeType"] = std::make_shared<JSONValue>(resource.mimeType.value());
    }
    return JSONValue{std::move(obj)};
}

} // namespace mcpagent
