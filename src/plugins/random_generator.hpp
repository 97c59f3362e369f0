#pragma once

#include <cstdint>
#include <functional>
#include <random>
#include <tracemark/series.hpp>

#include "plugins/plugin.hpp"

namespace tracemark
{

// Adds random minute-frequency time series ending now, for trying the tool out.
//   tracemark --RandomGenerator generate '{"days": 2, "n_series": 3}'
class RandomGenerator : public Plugin
{
   public:
    static constexpr const char* kName       = "RandomGenerator";
    static constexpr int         kDefaultDays = 20;
    static constexpr int         kMaxDays     = 3650;
    static constexpr int         kMaxSeries   = 100;

    // Seconds since the epoch.
    using Clock = std::function<double()>;

    explicit RandomGenerator(uint32_t seed = std::random_device{}(), Clock now = {});

    std::string name() const override { return kName; }
    void        bind(PluginHost& host) override { model_ = &host.model; }
    void        destroy() override { model_ = nullptr; }

    std::vector<PluginAction>        actions() override;
    std::map<std::string, CliAction> cli_actions() override;

    // Adds n_series series of `days` days each. Returns how many the model accepted.
    // Each series gets a microsecond "time_generated" stamp and its position in the
    // batch as "series", so siblings never share stored markings. Requests outside
    // 1..kMaxDays or 1..kMaxSeries are refused.
    size_t generate(int days, int n_series = 1);

    // One sample per minute from end - days to end, values ~ N(100, 100^2).
    Series make_series(int days, double end_seconds);

   private:
    double now() const;

    std::mt19937  rng_;
    Clock         now_;
    SessionModel* model_ = nullptr;
};

}   // namespace tracemark
