#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sandbox/tool_config.hpp"

namespace threatweaver::sandbox {

inline constexpr const char* kWorkspaceRoot = "/workspace";
inline constexpr const char* kExitCodeMarker = "__E2B_EXIT_CODE__";

inline constexpr int kCommandNotFoundExitCode = 127;
inline constexpr int kInnerTimeoutExitCode = 124;

std::string BuildEnsureWorkspaceScript();

// The backend runs interpreted code and has no exit-code channel, so the
// script reports the child's status as a marker line on stderr.
std::string BuildToolScript(const ToolConfig& config);

std::string BuildListWorkspaceScript();

struct ExitCodeExtraction {
    std::optional<int> exit_code;
    std::string stderr_text;
};

// Uses the last marker in `stderr_text` and strips every marker line.
ExitCodeExtraction ExtractExitCode(const std::string& stderr_text);

// Parses the listing printed by BuildListWorkspaceScript(). Entries that
// would escape the workspace (absolute, "..") are dropped.
std::vector<std::string> ParseWorkspaceListing(const std::string& stdout_text);

}  // namespace threatweaver::sandbox
