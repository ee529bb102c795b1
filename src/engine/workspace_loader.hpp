#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace timeledger {

// Reads a workspace snapshot document (settings, clients, projects, entries,
// licenses, servers, domains). Returns std::nullopt when the file cannot be
// read or is not a JSON object of that shape.
std::optional<WorkspaceSnapshot> loadWorkspaceSnapshot(const std::string &path);

std::optional<WorkspaceSnapshot> parseWorkspaceSnapshot(const std::string &document);

bool saveWorkspaceSnapshot(const WorkspaceSnapshot &snapshot, const std::string &path);

} // namespace timeledger
