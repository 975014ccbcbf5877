//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.h
// Purpose: Insertion-ordered catalogs of the tools and resources a server has advertised
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpagent/Protocol.h"

namespace mcpagent {

//==========================================================================================================
// CapabilityRegistry
// Purpose: Name-keyed tools and URI-keyed resources. Entries are only ever added or overwritten; a
//          refresh that omits an entry leaves it in place. Iteration follows first-insertion order.
//==========================================================================================================
class CapabilityRegistry {
public:
    //==========================================================================================================
    // UpsertTool / UpsertResource
    // Purpose: Insert, or replace as a whole when the key already exists (position is kept).
    // Returns:
    //   false when the entry was skipped because its key is empty.
    //==========================================================================================================
    bool UpsertTool(const Tool& tool);
    bool UpsertResource(const Resource& resource);

    std::optional<Tool> FindTool(const std::string& name) const;
    std::optional<Resource> FindResource(const std::string& uri) const;
    bool HasTool(const std::string& name) const;

    const std::vector<Tool>& Tools() const { return tools; }
    const std::vector<Resource>& Resources() const { return resources; }
    std::size_t ToolCount() const { return tools.size(); }
    std::size_t ResourceCount() const { return resources.size(); }

private:
    std::vector<Tool> tools;
    std::vector<Resource> resources;
    std::unordered_map<std::string, std::size_t> toolIndex;
    std::unordered_map<std::string, std::size_t> resourceIndex;
};

} // namespace mcpagent
