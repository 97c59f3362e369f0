#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <tracemark/config.hpp>
#include <tracemark/logger.hpp>

#include "io/json_util.hpp"

namespace tracemark
{

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string AppConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": 1,\n";
    os << "  \"fraction_preshown\": " << fraction_preshown << ",\n";
    os << "  \"preshow_cap\": " << preshow_cap << ",\n";
    os << "  \"decimate_threshold\": " << decimate_threshold << ",\n";
    os << "  \"decimated_points\": " << decimated_points << ",\n";
    os << "  \"minimum_y_range\": " << json::format_double(minimum_y_range) << ",\n";
    os << "  \"y_margin\": " << json::format_double(y_margin) << ",\n";
    os << "  \"redraw_delay_ms\": " << redraw_delay_ms << ",\n";
    os << "  \"span_alpha\": " << json::format_double(span_alpha) << ",\n";
    os << "  \"data_alpha\": " << json::format_double(data_alpha) << ",\n";
    os << "  \"line_width\": " << json::format_double(line_width) << ",\n";
    os << "  \"default_gap_limit\": \"" << json::escape(default_gap_limit) << "\",\n";
    os << "  \"cleaned_tag\": \"" << json::escape(cleaned_tag) << "\",\n";
    os << "  \"markings_store_path\": \"" << json::escape(markings_store_path) << "\",\n";
    os << "  \"enabled_plugins\": [";
    for (size_t i = 0; i < enabled_plugins.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        os << "\"" << json::escape(enabled_plugins[i]) << "\"";
    }
    os << "],\n";
    os << "  \"log_level\": \"" << json::escape(log_level) << "\",\n";
    os << "  \"log_file\": \"" << json::escape(log_file) << "\"\n";
    os << "}\n";
    return os.str();
}

namespace
{

void read_count(const std::vector<json::Member>& members, const char* key, size_t& target)
{
    const std::string* raw = json::find(members, key);
    if (!raw)
        return;
    auto v = json::as_number(*raw);
    if (!v || *v < 1.0)
    {
        TRACEMARK_LOG_WARN("config", "Ignoring bad value for {}: {}", key, *raw);
        return;
    }
    target = static_cast<size_t>(*v);
}

template <typename T>
void read_real(const std::vector<json::Member>& members,
               const char*                      key,
               T&                               target,
               double                           min_value)
{
    const std::string* raw = json::find(members, key);
    if (!raw)
        return;
    auto v = json::as_number(*raw);
    if (!v || *v < min_value)
    {
        TRACEMARK_LOG_WARN("config", "Ignoring bad value for {}: {}", key, *raw);
        return;
    }
    target = static_cast<T>(*v);
}

void read_text(const std::vector<json::Member>& members, const char* key, std::string& target)
{
    const std::string* raw = json::find(members, key);
    if (!raw)
        return;
    auto v = json::as_string(*raw);
    if (!v)
    {
        TRACEMARK_LOG_WARN("config", "Ignoring bad value for {}: {}", key, *raw);
        return;
    }
    target = *v;
}

}   // namespace

bool AppConfig::deserialize(const std::string& text)
{
    auto members = json::object_members(text);
    if (members.empty() && text.find('{') == std::string::npos)
        return false;

    if (json::read_number(members, "version", 1.0) > 1.0)
    {
        TRACEMARK_LOG_WARN("config", "Config was written by a newer version, ignoring it");
        return false;
    }

    read_count(members, "fraction_preshown", fraction_preshown);
    read_count(members, "preshow_cap", preshow_cap);
    read_count(members, "decimate_threshold", decimate_threshold);
    read_count(members, "decimated_points", decimated_points);
    read_real(members, "minimum_y_range", minimum_y_range, 0.0);
    read_real(members, "y_margin", y_margin, 0.0);
    read_real(members, "redraw_delay_ms", redraw_delay_ms, 0.0);
    read_real(members, "span_alpha", span_alpha, 0.0);
    read_real(members, "data_alpha", data_alpha, 0.0);
    read_real(members, "line_width", line_width, 0.0);
    read_text(members, "default_gap_limit", default_gap_limit);
    read_text(members, "cleaned_tag", cleaned_tag);
    read_text(members, "markings_store_path", markings_store_path);
    read_text(members, "log_level", log_level);
    read_text(members, "log_file", log_file);

    if (const std::string* raw = json::find(members, "enabled_plugins"))
    {
        std::vector<std::string> plugins;
        for (const auto& element : json::array_elements(*raw))
        {
            if (auto name = json::as_string(element))
                plugins.push_back(*name);
        }
        enabled_plugins = std::move(plugins);
    }
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool AppConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(text))
    {
        TRACEMARK_LOG_WARN("config", "{} is not a config object", path);
        return false;
    }
    TRACEMARK_LOG_DEBUG("config", "Loaded {}", path);
    return true;
}

bool AppConfig::save(const std::string& path) const
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        TRACEMARK_LOG_ERROR("config", "Cannot create {}: {}", dir.string(), ec.message());
        return false;
    }

    std::ofstream f(path);
    if (!f.is_open())
        return false;
    f << serialize();
    return f.good();
}

void AppConfig::apply_environment()
{
    if (const char* level = std::getenv("TRACEMARK_LOG_LEVEL"))
        log_level = level;
    if (const char* file = std::getenv("TRACEMARK_LOG_FILE"))
        log_file = file;
    if (const char* store = std::getenv("TRACEMARK_MARKINGS_STORE"))
        markings_store_path = store;
}

std::string AppConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        return "tracemark.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "tracemark";
    return (dir / "config.json").string();
}

void configure_logging(const AppConfig& config)
{
    auto& logger = Logger::instance();
    auto  level  = Logger::level_from_string(config.log_level);
    if (!level)
    {
        level = LogLevel::Info;
        logger.log(LogLevel::Warning, "config", "Unknown log level '" + config.log_level + "'");
    }
    logger.set_level(*level);
    logger.clear_sinks();
    logger.add_sink(sinks::console_sink());
    if (!config.log_file.empty())
        logger.add_sink(sinks::file_sink(config.log_file));
}

}   // namespace tracemark
