#include <doctest/doctest.h>

#include "skirmish/combat/SKResourceLedger.hpp"

#include <limits>

using namespace skirmish::combat;

TEST_CASE("ResourceLedger: starts full and moving for one second drains two AP")
{
    ResourceLedger ledger(ApConfig{});
    CHECK(ledger.current() == doctest::Approx(20.0f));
    CHECK(ledger.max() == doctest::Approx(20.0f));

    ActivityFlags moving{};
    moving.moving = true;

    const float delta = ledger.tick(1000.0f, moving);
    CHECK(delta == doctest::Approx(-2.0f));
    CHECK(ledger.current() == doctest::Approx(18.0f));
}

TEST_CASE("ResourceLedger: frame-sized ticks accumulate like one long tick")
{
    ResourceLedger ledger(ApConfig{});
    ActivityFlags moving{};
    moving.moving = true;

    for (int i = 0; i < 100; ++i)
        (void)ledger.tick(10.0f, moving);

    CHECK(ledger.current() == doctest::Approx(18.0f).epsilon(0.001));
}

TEST_CASE("ResourceLedger: dash drain wins over move drain and any drain wins over charging")
{
    ResourceLedger ledger(ApConfig{});

    ActivityFlags all{};
    all.moving = true;
    all.dashing = true;
    all.charging = true;

    (void)ledger.tick(1000.0f, all);
    CHECK(ledger.current() == doctest::Approx(16.0f));

    ActivityFlags moveAndCharge{};
    moveAndCharge.moving = true;
    moveAndCharge.charging = true;

    (void)ledger.tick(500.0f, moveAndCharge);
    CHECK(ledger.current() == doctest::Approx(15.0f));
}

TEST_CASE("ResourceLedger: charging regenerates and clamps at max")
{
    ApConfig cfg{};
    ResourceLedger ledger(cfg);
    REQUIRE(ledger.consume(12.0f));
    CHECK(ledger.current() == doctest::Approx(8.0f));

    ActivityFlags charging{};
    charging.charging = true;

    (void)ledger.tick(1000.0f, charging);
    CHECK(ledger.current() == doctest::Approx(16.0f));

    (void)ledger.tick(5000.0f, charging);
    CHECK(ledger.current() == doctest::Approx(cfg.max_ap));
}

TEST_CASE("ResourceLedger: drain never goes below zero")
{
    ResourceLedger ledger(ApConfig{});
    ActivityFlags dashing{};
    dashing.dashing = true;

    (void)ledger.tick(60'000.0f, dashing);
    CHECK(ledger.current() == doctest::Approx(0.0f));
    CHECK(ledger.empty());
}

TEST_CASE("ResourceLedger: idle ticks and non-positive deltas change nothing")
{
    ResourceLedger ledger(ApConfig{});
    REQUIRE(ledger.consume(5.0f));

    CHECK(ledger.tick(1000.0f, ActivityFlags{}) == doctest::Approx(0.0f));

    ActivityFlags moving{};
    moving.moving = true;
    CHECK(ledger.tick(0.0f, moving) == doctest::Approx(0.0f));
    CHECK(ledger.tick(-50.0f, moving) == doctest::Approx(0.0f));
    CHECK(ledger.current() == doctest::Approx(15.0f));
}

TEST_CASE("ResourceLedger: consume is all-or-nothing")
{
    ResourceLedger ledger(ApConfig{});
    REQUIRE(ledger.consume(18.0f));
    CHECK(ledger.current() == doctest::Approx(2.0f));

    CHECK_FALSE(ledger.consume(3.0f));
    CHECK(ledger.current() == doctest::Approx(2.0f));

    CHECK(ledger.consume(2.0f));
    CHECK(ledger.current() == doctest::Approx(0.0f));
}

TEST_CASE("ResourceLedger: consume rejects negative and non-finite amounts")
{
    ResourceLedger ledger(ApConfig{});
    CHECK_FALSE(ledger.consume(-1.0f));
    CHECK_FALSE(ledger.consume(std::numeric_limits<float>::quiet_NaN()));
    CHECK_FALSE(ledger.consume(std::numeric_limits<float>::infinity()));
    CHECK(ledger.current() == doctest::Approx(20.0f));

    CHECK(ledger.consume(0.0f));
    CHECK(ledger.current() == doctest::Approx(20.0f));
}

TEST_CASE("ResourceLedger: grant clamps to max and reports the applied amount")
{
    ResourceLedger ledger(ApConfig{});
    REQUIRE(ledger.consume(3.0f));

    CHECK(ledger.grant(5.0f, "test") == doctest::Approx(3.0f));
    CHECK(ledger.current() == doctest::Approx(20.0f));

    CHECK(ledger.grant(5.0f, "test") == doctest::Approx(0.0f));
    CHECK(ledger.grant(-5.0f, "test") == doctest::Approx(0.0f));
}

TEST_CASE("ResourceLedger: configure sanitizes rates and refills")
{
    ApConfig cfg{};
    cfg.max_ap = 10.0f;
    cfg.move_drain_per_sec = -3.0f;

    ResourceLedger ledger;
    ledger.configure(cfg);
    CHECK(ledger.current() == doctest::Approx(10.0f));
    CHECK(ledger.config().move_drain_per_sec == doctest::Approx(0.0f));

    ActivityFlags moving{};
    moving.moving = true;
    (void)ledger.tick(1000.0f, moving);
    CHECK(ledger.current() == doctest::Approx(10.0f));

    REQUIRE(ledger.consume(4.0f));
    ledger.reset();
    CHECK(ledger.current() == doctest::Approx(10.0f));
}
