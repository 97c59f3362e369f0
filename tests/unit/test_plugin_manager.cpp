#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "plugins/markings_io.hpp"
#include "plugins/plugin_manager.hpp"
#include "plugins/random_generator.hpp"
#include "ui/commands/command_registry.hpp"
#include <tracemark/session_model.hpp>

using namespace tracemark;

namespace
{

// Records its lifecycle so tests can see bind/destroy ordering.
class ProbePlugin : public Plugin
{
   public:
    explicit ProbePlugin(std::vector<std::string>& log) : log_(log) {}

    std::string name() const override { return "Probe"; }
    void        bind(PluginHost&) override { log_.push_back("bind"); }
    void        destroy() override { log_.push_back("destroy"); }

    std::vector<PluginAction> actions() override
    {
        return {{"ping", "Ping", [this]() { log_.push_back("ping"); }}};
    }

    std::map<std::string, CliAction> cli_actions() override
    {
        return {{"echo", [this](const std::string& args)
                 {
                     log_.push_back(args);
                     return !args.empty();
                 }}};
    }

   private:
    std::vector<std::string>& log_;
};

constexpr double kNow = 1700000000.0;

}   // namespace

class PluginManagerTest : public ::testing::Test
{
   protected:
    SessionModel             model;
    AppConfig                config;
    CommandRegistry          commands;
    std::vector<std::string> log;

    PluginRegistry registry()
    {
        PluginRegistry reg;
        reg["Probe"] = [this](const AppConfig&) -> std::unique_ptr<Plugin>
        { return std::make_unique<ProbePlugin>(log); };
        reg[MarkingsIO::kName] = [](const AppConfig&) -> std::unique_ptr<Plugin>
        { return std::make_unique<MarkingsIO>(nullptr); };
        reg[RandomGenerator::kName] = [](const AppConfig&) -> std::unique_ptr<Plugin>
        { return std::make_unique<RandomGenerator>(7u, []() { return kNow; }); };
        return reg;
    }
};

// ─── Lifecycle ───────────────────────────────────────────────────────────────

TEST_F(PluginManagerTest, EnableBindsOnce)
{
    PluginManager mgr(model, config, registry());
    EXPECT_TRUE(mgr.enable("Probe"));
    EXPECT_TRUE(mgr.enable("Probe"));
    EXPECT_EQ(log, (std::vector<std::string>{"bind"}));
    EXPECT_TRUE(mgr.is_enabled("Probe"));
    EXPECT_NE(mgr.find("Probe"), nullptr);
    EXPECT_EQ(mgr.plugin_count(), 1u);
}

TEST_F(PluginManagerTest, UnknownPluginIsRefused)
{
    PluginManager mgr(model, config, registry());
    EXPECT_FALSE(mgr.enable("Nope"));
    EXPECT_FALSE(mgr.disable("Nope"));
    EXPECT_EQ(mgr.find("Nope"), nullptr);
}

TEST_F(PluginManagerTest, DisableDestroys)
{
    PluginManager mgr(model, config, registry());
    mgr.enable("Probe");
    EXPECT_TRUE(mgr.disable("Probe"));
    EXPECT_FALSE(mgr.is_enabled("Probe"));
    EXPECT_EQ(log, (std::vector<std::string>{"bind", "destroy"}));
}

TEST_F(PluginManagerTest, DestructorDisablesAll)
{
    {
        PluginManager mgr(model, config, registry());
        mgr.enable("Probe");
    }
    EXPECT_EQ(log.back(), "destroy");
}

TEST_F(PluginManagerTest, EnableConfigured)
{
    config.enabled_plugins = {"Probe", "Nope", MarkingsIO::kName};
    PluginManager mgr(model, config, registry());
    EXPECT_EQ(mgr.enable_configured(), 2u);
    EXPECT_EQ(mgr.enabled(), (std::vector<std::string>{"MarkingsIO", "Probe"}));
    EXPECT_EQ(mgr.available(),
              (std::vector<std::string>{"MarkingsIO", "Probe", "RandomGenerator"}));
}

TEST_F(PluginManagerTest, BuiltinsAreRegistered)
{
    const PluginRegistry& builtins = builtin_plugins();
    EXPECT_EQ(builtins.count(MarkingsIO::kName), 1u);
    EXPECT_EQ(builtins.count(RandomGenerator::kName), 1u);

    PluginManager mgr(model, config);
    EXPECT_TRUE(mgr.enable(MarkingsIO::kName));
    EXPECT_NE(dynamic_cast<MarkingsIO*>(mgr.find(MarkingsIO::kName)), nullptr);
}

// ─── Commands ────────────────────────────────────────────────────────────────

TEST_F(PluginManagerTest, ActionsBecomeCommands)
{
    PluginManager mgr(model, config, registry());
    mgr.set_command_registry(&commands);
    mgr.enable("Probe");

    const Command* cmd = commands.find("Probe.ping");
    ASSERT_NE(cmd, nullptr);
    EXPECT_EQ(cmd->category, "Plugins");
    EXPECT_TRUE(commands.execute("Probe.ping"));
    EXPECT_EQ(log.back(), "ping");

    mgr.disable("Probe");
    EXPECT_EQ(commands.find("Probe.ping"), nullptr);
}

TEST_F(PluginManagerTest, LateRegistryPicksUpEnabledPlugins)
{
    PluginManager mgr(model, config, registry());
    mgr.enable(MarkingsIO::kName);
    mgr.enable(RandomGenerator::kName);
    mgr.set_command_registry(&commands);

    EXPECT_NE(commands.find("MarkingsIO.auto_mark_gaps"), nullptr);
    EXPECT_NE(commands.find("RandomGenerator.generate"), nullptr);
    EXPECT_EQ(commands.commands_in_category("Plugins").size(), 2u);
}

TEST_F(PluginManagerTest, RunCliAction)
{
    PluginManager mgr(model, config, registry());
    EXPECT_FALSE(mgr.run_cli_action("Probe", "echo", "{}"));

    mgr.enable("Probe");
    EXPECT_TRUE(mgr.run_cli_action("Probe", "echo", "{}"));
    EXPECT_EQ(log.back(), "{}");
    EXPECT_FALSE(mgr.run_cli_action("Probe", "echo", ""));
    EXPECT_FALSE(mgr.run_cli_action("Probe", "shout", "{}"));
}

// ─── RandomGenerator ─────────────────────────────────────────────────────────

TEST_F(PluginManagerTest, GenerateThroughCli)
{
    PluginManager mgr(model, config, registry());
    mgr.enable(RandomGenerator::kName);

    EXPECT_TRUE(mgr.run_cli_action(RandomGenerator::kName,
                                   "generate",
                                   R"({"days": 2, "n_series": 3})"));
    ASSERT_EQ(model.item_count(), 3u);

    const DataItem& item = *model.items()[0];
    EXPECT_EQ(item.name(), "Random 2 days");
    EXPECT_EQ(item.series().index_kind(), IndexKind::Time);
    EXPECT_EQ(item.series().size(), 2u * 1440u + 1u);
    EXPECT_DOUBLE_EQ(item.series().last_index(), kNow);
    EXPECT_DOUBLE_EQ(item.series().first_index(), kNow - 2 * 86400.0);

    ASSERT_EQ(item.metadata().count("length"), 1u);
    EXPECT_EQ(std::get<int64_t>(item.metadata().at("length")), 2881);
    EXPECT_EQ(std::get<std::string>(item.metadata().at("time_generated")),
              "2023-11-14T22:13:20.000000Z");

    // Same name twice: the second is kept as given.
    EXPECT_EQ(model.items()[1]->name(), "Random 2 days");
}

TEST_F(PluginManagerTest, GeneratedSeriesHaveDistinctMetadata)
{
    PluginManager mgr(model, config, registry());
    mgr.enable(RandomGenerator::kName);
    ASSERT_TRUE(mgr.run_cli_action(RandomGenerator::kName,
                                   "generate",
                                   R"({"days": 1, "n_series": 3})"));
    ASSERT_EQ(model.item_count(), 3u);

    for (size_t i = 0; i < 3; ++i)
    {
        const Metadata& metadata = model.items()[i]->metadata();
        EXPECT_EQ(std::get<int64_t>(metadata.at("series")), static_cast<int64_t>(i));
        EXPECT_EQ(model.match_items_by_metadata(metadata).size(), 1u);
    }
    EXPECT_NE(metadata_to_string(model.items()[0]->metadata()),
              metadata_to_string(model.items()[1]->metadata()));
}

TEST(RandomGenerator, TimeGeneratedKeepsMicroseconds)
{
    SessionModel    model;
    PluginHost      host{model, AppConfig{}};
    RandomGenerator gen(3u, []() { return kNow + 0.25; });
    gen.bind(host);
    ASSERT_EQ(gen.generate(1), 1u);
    EXPECT_EQ(std::get<std::string>(model.items()[0]->metadata().at("time_generated")),
              "2023-11-14T22:13:20.250000Z");
}

TEST_F(PluginManagerTest, GenerateRejectsBadArguments)
{
    PluginManager mgr(model, config, registry());
    mgr.enable(RandomGenerator::kName);
    EXPECT_FALSE(mgr.run_cli_action(RandomGenerator::kName, "generate", R"({"days": 0})"));
    EXPECT_FALSE(mgr.run_cli_action(RandomGenerator::kName, "generate", R"({"days": 1e12})"));
    EXPECT_FALSE(
        mgr.run_cli_action(RandomGenerator::kName, "generate", R"({"days": 1, "n_series": 1e6})"));
    EXPECT_EQ(model.item_count(), 0u);
}

TEST(RandomGenerator, RefusesOversizedRequests)
{
    SessionModel    model;
    PluginHost      host{model, AppConfig{}};
    RandomGenerator gen(1u, []() { return kNow; });
    gen.bind(host);
    EXPECT_EQ(gen.generate(RandomGenerator::kMaxDays + 1), 0u);
    EXPECT_EQ(gen.generate(1, RandomGenerator::kMaxSeries + 1), 0u);
    EXPECT_EQ(model.item_count(), 0u);
}

TEST(RandomGenerator, SameSeedSameValues)
{
    RandomGenerator a(42u, []() { return kNow; });
    RandomGenerator b(42u, []() { return kNow; });
    Series          sa = a.make_series(1, kNow);
    Series          sb = b.make_series(1, kNow);
    ASSERT_EQ(sa.size(), 1441u);
    EXPECT_TRUE(std::equal(sa.values().begin(), sa.values().end(), sb.values().begin()));
    EXPECT_DOUBLE_EQ(sa.index()[1] - sa.index()[0], 60.0);
}

TEST(RandomGenerator, UnboundGeneratesNothing)
{
    RandomGenerator gen(1u, []() { return kNow; });
    EXPECT_EQ(gen.generate(1), 0u);
}
