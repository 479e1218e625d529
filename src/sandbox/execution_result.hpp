#pragma once

#include <map>
#include <optional>
#include <string>

namespace threatweaver::sandbox {

struct ExecutionResult {
    bool success = false;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double duration = 0.0;
    // Remote path (e.g. "/workspace/out.txt") -> file content.
    std::map<std::string, std::string> output_files;
    std::optional<std::string> error;
};

inline bool IsSuccessful(int exit_code, const std::optional<std::string>& error) {
    return exit_code == 0 && !error.has_value();
}

}  // namespace threatweaver::sandbox
