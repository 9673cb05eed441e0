// src/tools/SkirmishSimMain.cpp
//
// skirmish_sim
// ------------
// Headless driver for one encounter: loads tuning + roster (or built-in
// defaults), runs a simple scripted player at a fixed frame step and logs
// every notification until the encounter ends or the time cap is reached.
//
// Exit codes: 0 encounter decided, 1 time cap reached, 2 bad arguments/config.

#include "skirmish/combat/SKEncounter.hpp"
#include "skirmish/logging/Log.hpp"
#include "skirmish/core/Profiling.hpp"
#include "tools/SimArgs.h"

#include <cmath>
#include <cstdio>
#include <string>

#include <spdlog/spdlog.h>

namespace sc = skirmish::combat;

namespace
{
    // Logs what the encounter publishes.
    struct SimListener
    {
        void on_combo(const sc::evt::ComboHit& e) { spdlog::info("{}", sc::evt::describe(e)); }
        void on_damaged(const sc::evt::PartyMemberDamaged& e) { spdlog::info("{}", sc::evt::describe(e)); }
        void on_downed(const sc::evt::PartyMemberDowned& e) { spdlog::warn("Party member {} is down", e.member); }
        void on_no_ap(const sc::evt::NoResource& e)
        {
            spdlog::debug("Not enough AP for {} ({:.1f} available)", sc::evt::to_string(e.action), e.available);
        }
        void on_behavior(const sc::evt::BehaviorStateChanged& e)
        {
            spdlog::info("Opponent {}: {} -> {}", e.opponent, sc::to_string(e.previous), sc::to_string(e.current));
        }
        void on_removed(const sc::evt::OpponentRemoved& e)
        {
            spdlog::info("Opponent {} left: {}", e.opponent, sc::to_string(e.fate));
        }
        void on_turn_started(const sc::evt::EnemyTurnStarted& e) { spdlog::info("Enemy turn: {} action(s)", e.queued); }
        void on_turn_ended(const sc::evt::EnemyTurnEnded& e) { spdlog::info("Enemy turn over: {}", sc::to_string(e.reason)); }
        void on_ended(const sc::evt::EncounterEnded& e) { spdlog::info("{}", sc::evt::describe(e)); }

        void connect(entt::dispatcher& d)
        {
            d.sink<sc::evt::ComboHit>().connect<&SimListener::on_combo>(*this);
            d.sink<sc::evt::PartyMemberDamaged>().connect<&SimListener::on_damaged>(*this);
            d.sink<sc::evt::PartyMemberDowned>().connect<&SimListener::on_downed>(*this);
            d.sink<sc::evt::NoResource>().connect<&SimListener::on_no_ap>(*this);
            d.sink<sc::evt::BehaviorStateChanged>().connect<&SimListener::on_behavior>(*this);
            d.sink<sc::evt::OpponentRemoved>().connect<&SimListener::on_removed>(*this);
            d.sink<sc::evt::EnemyTurnStarted>().connect<&SimListener::on_turn_started>(*this);
            d.sink<sc::evt::EnemyTurnEnded>().connect<&SimListener::on_turn_ended>(*this);
            d.sink<sc::evt::EncounterEnded>().connect<&SimListener::on_ended>(*this);
        }
    };

    // Scripted player: walk to the nearest opponent, strike while AP lasts,
    // recharge when low.
    class Autopilot
    {
    public:
        explicit Autopilot(sc::Encounter& enc) : enc_(enc) {}

        void step()
        {
            const sc::EncounterSnapshot s = enc_.snapshot();
            if (s.outcome || s.opponents.empty())
                return;

            const sc::PartyView* leader = nullptr;
            for (const sc::PartyView& p : s.party)
                if (p.leader) leader = &p;
            if (!leader || leader->downed)
                return;

            if (charging_)
            {
                if (s.ap >= s.ap_max * 0.9f)
                {
                    (void)enc_.request_charge_stop();
                    charging_ = false;
                }
                return;
            }

            const float cost = enc_.config().combo.melee_ap_cost;
            if (s.ap < cost)
            {
                (void)enc_.request_move(0);
                charging_ = enc_.request_charge_start();
                return;
            }

            const sc::OpponentView* nearest = nullptr;
            float best = 0.0f;
            for (const sc::OpponentView& o : s.opponents)
            {
                const float d = std::fabs(o.position.x - leader->position.x);
                if (!nearest || d < best)
                {
                    nearest = &o;
                    best = d;
                }
            }

            if (best > enc_.config().combo.optimal_melee_distance)
            {
                (void)enc_.request_move(nearest->position.x > leader->position.x ? 1 : -1);
                return;
            }

            (void)enc_.request_move(0);
            (void)enc_.request_strike();
        }

    private:
        sc::Encounter& enc_;
        bool charging_ = false;
    };
} // namespace

int main(int argc, char** argv)
{
    const skirmish::tools::SimArgs args = skirmish::tools::ParseSimArgs(argc, argv);
    if (args.showHelp)
    {
        std::fputs(skirmish::tools::BuildSimHelpText().c_str(), stdout);
        return 0;
    }

    skirmish::logsys::LogOptions logOpts;
    logOpts.level = skirmish::logsys::level_from_string(args.logLevel);
    if (args.logFile)
        logOpts.file = *args.logFile;
    (void)skirmish::logsys::init(logOpts);

    if (!args.unknown.empty())
    {
        for (const std::string& u : args.unknown)
            spdlog::error("Unrecognized or invalid argument: {}", u);
        std::fputs(skirmish::tools::BuildSimHelpText().c_str(), stderr);
        return 2;
    }

    sc::EncounterConfig cfg;
    sc::RosterData roster;
    try
    {
        cfg = args.configPath ? sc::load_encounter_config(*args.configPath) : sc::EncounterConfig{};
        roster = args.rosterPath ? sc::load_roster(*args.rosterPath) : sc::default_roster();
    }
    catch (const skirmish::ConfigError& e)
    {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    }

    if (args.mode)
        cfg.mode = sc::acting_mode_from_string(*args.mode);
    if (args.seed)
        cfg.seed = *args.seed;

    try
    {
        sc::Encounter encounter(cfg, roster);

        SimListener listener;
        listener.connect(encounter.dispatcher());

        Autopilot pilot(encounter);
        const float dt = static_cast<float>(args.tickMs);
        for (int elapsed = 0; elapsed < args.durationMs && !encounter.finished(); elapsed += args.tickMs)
        {
            SKIRMISH_TRACY_FRAME();
            pilot.step();
            encounter.tick(dt);
        }

        if (!encounter.finished())
        {
            spdlog::warn("Time cap of {} ms reached without a decision", args.durationMs);
            return 1;
        }

        const sc::OutcomePayload& out = *encounter.outcome();
        spdlog::info("Result: {} after {:.0f} ms, reward {}", sc::to_string(out.kind), encounter.now_ms(), out.reward);
        for (const sc::PartyHealthSnapshot& p : out.party)
            spdlog::info("  party {}: {:.0f}/{:.0f}{}", p.id, p.health, p.max_health, p.downed ? " (down)" : "");
    }
    catch (const skirmish::ConfigError& e)
    {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    }

    return 0;
}
