#include <doctest/doctest.h>

#include "skirmish/combat/SKEventScheduler.hpp"

using namespace skirmish::combat;

TEST_CASE("EventScheduler: drain returns due events ordered by time then scheduling order")
{
    EventScheduler s;
    const auto late = s.schedule(ScheduledEventKind::DashCooldownReady, 1, 350.0);
    const auto a = s.schedule(ScheduledEventKind::KnockbackEnd, 10, 200.0);
    const auto b = s.schedule(ScheduledEventKind::AttackExpired, 4, 200.0);
    const auto early = s.schedule(ScheduledEventKind::DashEnd, 1, 100.0);

    const auto due = s.drain(300.0);
    REQUIRE(due.size() == 3);
    CHECK(due[0].id == early);
    CHECK(due[1].id == a);
    CHECK(due[2].id == b);

    CHECK(s.pending() == 1);
    CHECK(s.has_pending(ScheduledEventKind::DashCooldownReady, 1));

    const auto rest = s.drain(350.0);
    REQUIRE(rest.size() == 1);
    CHECK(rest[0].id == late);
    CHECK(s.pending() == 0);
}

TEST_CASE("EventScheduler: cancel_for only drops matching kind and subject")
{
    EventScheduler s;
    (void)s.schedule(ScheduledEventKind::KnockbackEnd, 10, 100.0);
    (void)s.schedule(ScheduledEventKind::KnockbackEnd, 11, 100.0);
    (void)s.schedule(ScheduledEventKind::AttackExpired, 10, 100.0);

    CHECK(s.cancel_for(ScheduledEventKind::KnockbackEnd, 10) == 1);
    CHECK_FALSE(s.has_pending(ScheduledEventKind::KnockbackEnd, 10));
    CHECK(s.has_pending(ScheduledEventKind::KnockbackEnd, 11));
    CHECK(s.has_pending(ScheduledEventKind::AttackExpired, 10));
    CHECK(s.pending() == 2);
}

TEST_CASE("EventScheduler: nothing fires after clear")
{
    EventScheduler s;
    (void)s.schedule(ScheduledEventKind::DashEnd, 1, 10.0);
    (void)s.schedule(ScheduledEventKind::AttackExpired, 2, 20.0);

    s.clear();
    CHECK(s.pending() == 0);
    CHECK(s.drain(1'000'000.0).empty());
}
