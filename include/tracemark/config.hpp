#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tracemark
{

// Tuning constants and paths. Defaults match the built-in behaviour; a JSON file
// and TRACEMARK_* environment variables may override them.
struct AppConfig
{
    // Interval sync
    size_t fraction_preshown  = 6;       // First item shows len / fraction_preshown points
    size_t preshow_cap        = 50000;   // ... but never more than this
    size_t decimate_threshold = 8000;    // Outline decimation kicks in at this many points
    size_t decimated_points   = 2000;    // Target point count after decimation
    double minimum_y_range    = 10.0;    // Floor for the detail y span used for margins
    double y_margin           = 0.02;    // Fraction of the y span added above and below
    int    redraw_delay_ms    = 10;

    // Rendering
    float span_alpha = 0.3f;
    float data_alpha = 0.8f;
    float line_width = 1.1f;

    // Markings
    std::string default_gap_limit = "20s";
    std::string cleaned_tag       = "cleaned";

    // Storage and plugins
    std::string              markings_store_path;   // Empty: in-memory store
    std::vector<std::string> enabled_plugins = {"MarkingsIO"};

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Parses a JSON document; unknown keys are ignored and malformed values keep
    // their current setting. Returns false if `json` is not an object.
    bool        deserialize(const std::string& json);
    std::string serialize() const;

    bool load(const std::string& path);
    bool save(const std::string& path) const;

    // TRACEMARK_LOG_LEVEL, TRACEMARK_LOG_FILE, TRACEMARK_MARKINGS_STORE.
    void apply_environment();

    // ~/.config/tracemark/config.json
    static std::string default_path();
};

// Sets the logger level and installs console (and optional file) sinks.
void configure_logging(const AppConfig& config);

}   // namespace tracemark
