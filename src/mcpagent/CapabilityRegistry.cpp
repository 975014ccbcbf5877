//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.cpp
// Purpose: Upsert-only tool and resource catalogs
//==========================================================================================================

#include "mcpagent/CapabilityRegistry.h"
#include "logging/Logger.h"

namespace mcpagent {

bool CapabilityRegistry::UpsertTool(const Tool& tool) {
    if (tool.name.empty()) {
        LOG_WARN("CapabilityRegistry: skipping tool without a name");
        return false;
    }
    auto it = toolIndex.find(tool.name);
    if (it != toolIndex.end()) {
        tools[it->second] = tool;
        return true;
    }
    toolIndex.emplace(tool.name, tools.size());
    tools.push_back(tool);
    return true;
}

bool CapabilityRegistry::UpsertResource(const Resource& resource) {
    if (resource.uri.empty()) {
        LOG_WARN("CapabilityRegistry: skipping resource without a uri");
        return false;
    }
    auto it = resourceIndex.find(resource.uri);
    if (it != resourceIndex.end()) {
        resources[it->second] = resource;
        return true;
    }
    resourceIndex.emplace(resource.uri, resources.size());
    resources.push_back(resource);
    return true;
}

std::optional<Tool> CapabilityRegistry::FindTool(const std::string& name) const {
    auto it = toolIndex.find(name);
    if (it == toolIndex.end()) {
        return std::nullopt;
    }
    return tools[it->second];
}

std::optional<Resource> CapabilityRegistry::FindResource(const std::string& uri) const {
    auto it = resourceIndex.find(uri);
    if (it == resourceIndex.end()) {
        return std::nullopt;
    }
    return resources[it->second];
}

bool CapabilityRegistry::HasTool(const std::string& name) const {
    return toolIndex.find(name) != toolIndex.end();
}

} // namespace mcpagent
