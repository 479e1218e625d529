#include "sandbox/script_builder.hpp"

#include <filesystem>
#include <regex>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace threatweaver::sandbox {
namespace {

// A JSON array of strings, or an object of string values, is also a valid
// Python literal.
std::string ToPythonLiteral(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool IsSafeRelativePath(const std::string& entry) {
    if (entry.empty()) {
        return false;
    }
    const std::filesystem::path path(entry);
    if (path.is_absolute() || path.has_root_name()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string BuildEnsureWorkspaceScript() {
    std::ostringstream code;
    code << "import os\n"
         << "os.makedirs(" << ToPythonLiteral(kWorkspaceRoot) << ", exist_ok=True)\n";
    return code.str();
}

std::string BuildToolScript(const ToolConfig& config) {
    nlohmann::json argv = nlohmann::json::array();
    argv.push_back(config.command);
    for (const auto& arg : config.args) {
        argv.push_back(arg);
    }
    nlohmann::json env = nlohmann::json::object();
    for (const auto& [key, value] : config.env) {
        env[key] = value;
    }

    std::ostringstream code;
    code << "import os\n"
         << "import subprocess\n"
         << "import sys\n"
         << "\n"
         << "_tw_argv = " << ToPythonLiteral(argv) << "\n"
         << "_tw_env = dict(os.environ)\n"
         << "_tw_env.update(" << ToPythonLiteral(env) << ")\n"
         << "_tw_code = 0\n"
         << "try:\n"
         << "    _tw_proc = subprocess.run(\n"
         << "        _tw_argv,\n"
         << "        capture_output=True,\n"
         << "        text=True,\n"
         << "        errors=\"replace\",\n"
         << "        timeout=" << config.timeout << ",\n"
         << "        cwd=" << ToPythonLiteral(kWorkspaceRoot) << ",\n"
         << "        env=_tw_env,\n"
         << "    )\n"
         << "    _tw_code = _tw_proc.returncode\n"
         << "    if _tw_proc.stdout:\n"
         << "        sys.stdout.write(_tw_proc.stdout)\n"
         << "    if _tw_proc.stderr:\n"
         << "        sys.stderr.write(_tw_proc.stderr)\n"
         << "except FileNotFoundError as _tw_exc:\n"
         << "    sys.stderr.write(str(_tw_exc) + \"\\n\")\n"
         << "    _tw_code = " << kCommandNotFoundExitCode << "\n"
         << "except subprocess.TimeoutExpired:\n"
         << "    sys.stderr.write(\"command timed out after " << config.timeout << "s\\n\")\n"
         << "    _tw_code = " << kInnerTimeoutExitCode << "\n"
         << "sys.stdout.flush()\n"
         << "sys.stderr.write(\"\\n" << kExitCodeMarker << "=%d\\n\" % _tw_code)\n"
         << "sys.stderr.flush()\n";
    return code.str();
}

std::string BuildListWorkspaceScript() {
    std::ostringstream code;
    code << "import json\n"
         << "import os\n"
         << "\n"
         << "_tw_root = " << ToPythonLiteral(kWorkspaceRoot) << "\n"
         << "_tw_files = []\n"
         << "if os.path.isdir(_tw_root):\n"
         << "    for _tw_dir, _tw_subdirs, _tw_names in os.walk(_tw_root):\n"
         << "        _tw_subdirs.sort()\n"
         << "        for _tw_name in sorted(_tw_names):\n"
         << "            _tw_full = os.path.join(_tw_dir, _tw_name)\n"
         << "            if os.path.isfile(_tw_full):\n"
         << "                _tw_files.append(os.path.relpath(_tw_full, _tw_root))\n"
         << "print(json.dumps(_tw_files))\n";
    return code.str();
}

ExitCodeExtraction ExtractExitCode(const std::string& stderr_text) {
    static const std::regex kMarkerPattern(
        std::string(kExitCodeMarker) + "=(-?[0-9]+)[ \\t]*\\r?\\n?");

    ExitCodeExtraction extraction{};
    for (std::sregex_iterator it(stderr_text.begin(), stderr_text.end(), kMarkerPattern), end;
         it != end; ++it) {
        try {
            extraction.exit_code = std::stoi((*it)[1].str());
        } catch (const std::out_of_range&) {
            extraction.exit_code = -1;
        }
    }
    extraction.stderr_text = std::regex_replace(stderr_text, kMarkerPattern, "");
    return extraction;
}

std::vector<std::string> ParseWorkspaceListing(const std::string& stdout_text) {
    std::vector<std::string> entries;
    const auto trimmed = threatweaver::utils::Trim(stdout_text);
    if (trimmed.empty()) {
        return entries;
    }
    // The listing is the last line; anything printed before it is noise.
    const auto last_newline = trimmed.find_last_of('\n');
    const auto last_line = last_newline == std::string::npos ? trimmed : trimmed.substr(last_newline + 1);
    auto json = nlohmann::json::parse(last_line, nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        return entries;
    }
    for (const auto& item : json) {
        if (!item.is_string()) {
            continue;
        }
        auto entry = item.get<std::string>();
        if (IsSafeRelativePath(entry)) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

}  // namespace threatweaver::sandbox
