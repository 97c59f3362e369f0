#include "plugins/random_generator.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <tracemark/logger.hpp>
#include <tracemark/session_model.hpp>

#include "io/json_util.hpp"

namespace tracemark
{

namespace
{

// e.g. 2023-11-14T22:13:20.250000Z
std::string iso_utc(double seconds)
{
    double      whole  = std::floor(seconds);
    auto        micros = static_cast<long>(std::llround((seconds - whole) * 1e6));
    std::time_t t      = static_cast<std::time_t>(whole);
    if (micros >= 1000000)
    {
        micros -= 1000000;
        ++t;
    }
    std::tm tm{};
    gmtime_r(&t, &tm);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s.%06ldZ", date, micros);
    return buf;
}

}   // namespace

RandomGenerator::RandomGenerator(uint32_t seed, Clock now) : rng_(seed), now_(std::move(now)) {}

double RandomGenerator::now() const
{
    if (now_)
        return now_();
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

Series RandomGenerator::make_series(int days, double end_seconds)
{
    constexpr double kStep  = 60.0;
    double           start  = end_seconds - days * 86400.0;
    size_t           points = static_cast<size_t>(days) * 1440 + 1;

    std::normal_distribution<double> randn(0.0, 1.0);
    std::vector<double>              index;
    std::vector<double>              values;
    index.reserve(points);
    values.reserve(points);
    for (size_t i = 0; i < points; ++i)
    {
        index.push_back(start + static_cast<double>(i) * kStep);
        values.push_back(randn(rng_) * 100.0 + 100.0);
    }
    return Series(std::move(index), std::move(values), IndexKind::Time);
}

size_t RandomGenerator::generate(int days, int n_series)
{
    if (!model_)
    {
        TRACEMARK_LOG_ERROR("plugin", "RandomGenerator is not bound to a session");
        return 0;
    }
    if (days <= 0 || n_series <= 0 || days > kMaxDays || n_series > kMaxSeries)
    {
        TRACEMARK_LOG_ERROR("plugin", "Cannot generate {} series of {} days", n_series, days);
        return 0;
    }

    size_t added = 0;
    for (int i = 0; i < n_series; ++i)
    {
        double end    = now();
        Series series = make_series(days, end);

        Metadata metadata;
        metadata["time_generated"] = iso_utc(end);
        metadata["series"]         = static_cast<int64_t>(i);
        metadata["length"]         = static_cast<int64_t>(series.size());

        std::string name = "Random " + std::to_string(days) + " days";
        if (model_->add_item(std::move(series), name, std::move(metadata)) == Status::Ok)
            ++added;
    }
    return added;
}

std::vector<PluginAction> RandomGenerator::actions()
{
    return {
        {"generate", "Generate", [this]() { generate(kDefaultDays); }},
    };
}

std::map<std::string, CliAction> RandomGenerator::cli_actions()
{
    return {
        {"generate",
         [this](const std::string& json_args)
         {
             auto   args     = json::object_members(json_args);
             double days     = json::read_number(args, "days", kDefaultDays);
             double n_series = json::read_number(args, "n_series", 1.0);
             bool days_ok   = days >= 1.0 && days <= kMaxDays;
             bool series_ok = n_series >= 1.0 && n_series <= kMaxSeries;
             if (!days_ok || !series_ok)
             {
                 TRACEMARK_LOG_ERROR("plugin",
                                     "generate needs 1 <= days <= {} and 1 <= n_series <= {}",
                                     kMaxDays,
                                     kMaxSeries);
                 return false;
             }
             return generate(static_cast<int>(days), static_cast<int>(n_series)) > 0;
         }},
    };
}

}   // namespace tracemark
