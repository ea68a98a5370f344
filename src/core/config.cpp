#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "../ipc/transport.hpp"

namespace xplorer::core
{

// ─── JSON serialization ──────────────────────────────────────────────────────

namespace
{

constexpr int CONFIG_VERSION = 1;

std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

// Position just after the ':' following "key", or npos.
size_t find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    return json.find_first_not_of(" \t\r\n", pos + 1);
}

bool read_json_string(const std::string& json, const std::string& key, std::string& out)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos || json[pos] != '"')
        return false;

    std::string value;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '"')
        {
            out = std::move(value);
            return true;
        }
        if (c == '\\' && i + 1 < json.size())
        {
            char e = json[++i];
            switch (e)
            {
                case 'n':
                    value += '\n';
                    break;
                case 't':
                    value += '\t';
                    break;
                default:
                    value += e;
                    break;
            }
            continue;
        }
        value += c;
    }
    return false;
}

template <typename Int>
bool read_json_int(const std::string& json, const std::string& key, Int& out)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return false;
    char*       end   = nullptr;
    const char* start = json.c_str() + pos;
    long long   v     = std::strtoll(start, &end, 10);
    if (end == start || v < 0)
        return false;
    out = static_cast<Int>(v);
    return true;
}

bool parse_int_arg(const char* text, long long& out)
{
    if (!text || !*text)
        return false;
    char* end = nullptr;
    out       = std::strtoll(text, &end, 10);
    return end && *end == '\0' && out >= 0;
}

}   // namespace

std::string ShellConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CONFIG_VERSION << ",\n";
    os << "  \"request_socket\": \"" << escape_json(request_socket) << "\",\n";
    os << "  \"event_socket\": \"" << escape_json(event_socket) << "\",\n";
    os << "  \"request_timeout_ms\": " << request_timeout_ms << ",\n";
    os << "  \"drag_threshold_px\": " << drag_threshold_px << ",\n";
    os << "  \"tab_bar_height_px\": " << tab_bar_height_px << ",\n";
    os << "  \"drag_poll_interval_ms\": " << drag_poll_interval_ms << ",\n";
    os << "  \"window_width\": " << window_width << ",\n";
    os << "  \"window_height\": " << window_height << ",\n";
    os << "  \"log_level\": \"" << Logger::level_to_string(log_level) << "\",\n";
    os << "  \"log_file\": \"" << escape_json(log_file) << "\"\n";
    os << "}\n";
    return os.str();
}

bool ShellConfig::deserialize(const std::string& json)
{
    if (json.find('{') == std::string::npos)
        return false;

    int version = CONFIG_VERSION;
    if (read_json_int(json, "version", version) && version > CONFIG_VERSION)
        return false;

    read_json_string(json, "request_socket", request_socket);
    read_json_string(json, "event_socket", event_socket);
    read_json_int(json, "request_timeout_ms", request_timeout_ms);
    read_json_int(json, "drag_threshold_px", drag_threshold_px);
    read_json_int(json, "tab_bar_height_px", tab_bar_height_px);
    read_json_int(json, "drag_poll_interval_ms", drag_poll_interval_ms);
    read_json_int(json, "window_width", window_width);
    read_json_int(json, "window_height", window_height);
    read_json_string(json, "log_file", log_file);

    std::string level;
    if (read_json_string(json, "log_level", level))
    {
        if (auto parsed = Logger::level_from_string(level))
            log_level = *parsed;
        else
            XPLORER_LOG_WARN("config", "unknown log level '{}', keeping default", level);
    }
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool ShellConfig::save(const std::string& path) const
{
    auto            dir = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            XPLORER_LOG_ERROR("config", "cannot create {}: {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
        return false;
    f << serialize();
    return f.good();
}

bool ShellConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string ShellConfig::default_path()
{
    std::filesystem::path dir;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        dir = std::filesystem::path(xdg) / "xplorer";
    else if (const char* home = std::getenv("HOME"); home && *home)
        dir = std::filesystem::path(home) / ".config" / "xplorer";
    else
        return "shell.json";
    return (dir / "shell.json").string();
}

void ShellConfig::resolve_defaults()
{
    if (request_socket.empty())
        request_socket = ipc::default_request_socket_path();
    if (event_socket.empty())
        event_socket = ipc::default_event_socket_path();
}

// ─── Command line ────────────────────────────────────────────────────────────

CommandLine parse_command_line(int argc, const char* const* argv)
{
    CommandLine cl;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h")
            cl.show_help = true;
        else if (arg == "--config")
        {
            if (i + 1 >= argc)
            {
                cl.error = "--config needs a path";
                break;
            }
            cl.config_path = argv[++i];
        }
    }
    return cl;
}

bool apply_args(ShellConfig& cfg, int argc, const char* const* argv, std::string& error)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h")
            continue;

        if (i + 1 >= argc)
        {
            error = "unknown or incomplete option: " + arg;
            return false;
        }
        const char* value = argv[i + 1];

        if (arg == "--config")
        {
            // Consumed by parse_command_line
        }
        else if (arg == "--request-socket")
            cfg.request_socket = value;
        else if (arg == "--event-socket")
            cfg.event_socket = value;
        else if (arg == "--log-file")
            cfg.log_file = value;
        else if (arg == "--timeout-ms")
        {
            long long ms = 0;
            if (!parse_int_arg(value, ms) || ms == 0)
            {
                error = std::string("invalid --timeout-ms: ") + value;
                return false;
            }
            cfg.request_timeout_ms = static_cast<uint32_t>(ms);
        }
        else if (arg == "--log-level")
        {
            auto level = Logger::level_from_string(value);
            if (!level)
            {
                error = std::string("invalid --log-level: ") + value;
                return false;
            }
            cfg.log_level = *level;
        }
        else
        {
            error = "unknown option: " + arg;
            return false;
        }
        ++i;
    }
    return true;
}

const char* usage()
{
    return "usage: xplorer [options]\n"
           "  --config <path>           shell config file\n"
           "  --request-socket <path>   backend request endpoint\n"
           "  --event-socket <path>     backend event endpoint\n"
           "  --timeout-ms <n>          request timeout in milliseconds\n"
           "  --log-level <level>       trace|debug|info|warn|error|critical\n"
           "  --log-file <path>         also write logs to this file\n";
}

}   // namespace xplorer::core
