#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <xplorer/logger.hpp>

namespace xplorer::core
{

// Shell-side settings. Persisted as JSON; command-line flags win over the file.
struct ShellConfig
{
    std::string request_socket;
    std::string event_socket;
    uint32_t    request_timeout_ms    = 30000;
    int         drag_threshold_px     = 10;
    int         tab_bar_height_px     = 40;
    uint32_t    drag_poll_interval_ms = 16;
    int         window_width          = 1200;
    int         window_height         = 800;
    LogLevel    log_level             = LogLevel::Info;
    std::string log_file;

    std::string serialize() const;

    // Unknown keys are ignored, missing keys keep their current value.
    // Returns false on an empty document or a newer format version.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // $XDG_CONFIG_HOME/xplorer/shell.json, else ~/.config/xplorer/shell.json
    static std::string default_path();

    // Fills the socket paths left empty with the runtime-dir defaults.
    void resolve_defaults();
};

struct CommandLine
{
    std::string config_path;
    bool        show_help = false;
    std::string error;
};

// Scans argv for --config first so the file can be loaded before the
// remaining overrides are applied.
CommandLine parse_command_line(int argc, const char* const* argv);

// Applies the override flags to cfg. Returns false and fills error on a
// malformed flag.
bool apply_args(ShellConfig& cfg, int argc, const char* const* argv, std::string& error);

const char* usage();

}   // namespace xplorer::core
