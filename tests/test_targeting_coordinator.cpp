#include <doctest/doctest.h>

#include "skirmish/combat/SKTargetingCoordinator.hpp"

#include <vector>

using namespace skirmish::combat;

TEST_CASE("TargetingCoordinator: confirm with no opponents is a no-op")
{
    TargetingCoordinator t;
    REQUIRE(t.begin_selection());

    const std::vector<CombatantId> none;
    CHECK_FALSE(t.confirm(none));
    CHECK(t.state() == TargetingState::Selecting);
    CHECK(t.locked_id() == kInvalidCombatant);
    CHECK_FALSE(t.select_next(none));
    CHECK(t.highlighted_id(none) == kInvalidCombatant);
}

TEST_CASE("TargetingCoordinator: selection wraps in both directions")
{
    TargetingCoordinator t;
    const std::vector<CombatantId> roster{10, 11, 12};

    REQUIRE(t.begin_selection());
    CHECK(t.highlighted_index() == 0);
    CHECK(t.highlighted_id(roster) == 10);

    CHECK(t.select_previous(roster));
    CHECK(t.highlighted_index() == 2);
    CHECK(t.highlighted_id(roster) == 12);

    CHECK(t.select_next(roster));
    CHECK(t.highlighted_index() == 0);

    CHECK(t.select_next(roster));
    CHECK(t.select_next(roster));
    CHECK(t.select_next(roster));
    CHECK(t.highlighted_index() == 0);
}

TEST_CASE("TargetingCoordinator: full Free -> Selecting -> Locked -> Free cycle")
{
    TargetingCoordinator t;
    const std::vector<CombatantId> roster{10, 11, 12};

    CHECK_FALSE(t.select_next(roster));
    CHECK_FALSE(t.confirm(roster));
    CHECK_FALSE(t.disengage());

    REQUIRE(t.begin_selection());
    CHECK_FALSE(t.begin_selection());
    REQUIRE(t.select_next(roster));
    REQUIRE(t.confirm(roster));

    CHECK(t.state() == TargetingState::Locked);
    CHECK(t.locked_id() == 11);
    CHECK(t.highlighted_id(roster) == kInvalidCombatant);
    CHECK(t.validate_lock(roster) == 11);

    CHECK_FALSE(t.begin_selection());
    CHECK(t.disengage());
    CHECK(t.state() == TargetingState::Free);
    CHECK(t.locked_id() == kInvalidCombatant);
}

TEST_CASE("TargetingCoordinator: cancel returns to Free")
{
    TargetingCoordinator t;
    const std::vector<CombatantId> roster{10, 11};

    REQUIRE(t.begin_selection());
    REQUIRE(t.select_next(roster));
    CHECK(t.cancel_selection());
    CHECK(t.state() == TargetingState::Free);
    CHECK_FALSE(t.cancel_selection());

    REQUIRE(t.begin_selection());
    CHECK(t.highlighted_index() == 0);
}

TEST_CASE("TargetingCoordinator: removing the locked opponent falls back to selection")
{
    TargetingCoordinator t;
    std::vector<CombatantId> roster{10, 11, 12};

    REQUIRE(t.begin_selection());
    REQUIRE(t.select_next(roster));
    REQUIRE(t.confirm(roster));
    REQUIRE(t.locked_id() == 11);

    roster = {10, 12};
    CHECK_FALSE(t.on_opponent_removed(10, roster)); // not the locked one
    CHECK(t.state() == TargetingState::Locked);

    roster = {12};
    CHECK(t.on_opponent_removed(11, roster));
    CHECK(t.state() == TargetingState::Selecting);
    CHECK(t.highlighted_index() == 0);
    CHECK(t.locked_id() == kInvalidCombatant);
}

TEST_CASE("TargetingCoordinator: removing the last locked opponent returns to Free")
{
    TargetingCoordinator t;
    const std::vector<CombatantId> roster{10};

    REQUIRE(t.begin_selection());
    REQUIRE(t.confirm(roster));

    const std::vector<CombatantId> none;
    CHECK(t.on_opponent_removed(10, none));
    CHECK(t.state() == TargetingState::Free);
}

TEST_CASE("TargetingCoordinator: validate_lock notices a vanished target")
{
    TargetingCoordinator t;
    const std::vector<CombatantId> roster{10, 11};

    REQUIRE(t.begin_selection());
    REQUIRE(t.confirm(roster));
    REQUIRE(t.locked_id() == 10);

    const std::vector<CombatantId> remaining{11};
    CHECK(t.validate_lock(remaining) == kInvalidCombatant);
    CHECK(t.state() == TargetingState::Selecting);
    CHECK(t.highlighted_id(remaining) == 11);
}

TEST_CASE("TargetingCoordinator: highlight stays on the same opponent when an earlier one leaves")
{
    TargetingCoordinator t;
    const std::vector<CombatantId> roster{10, 11, 12};

    REQUIRE(t.begin_selection());
    REQUIRE(t.select_next(roster));
    REQUIRE(t.select_next(roster));
    REQUIRE(t.highlighted_id(roster) == 12);

    const std::vector<CombatantId> remaining{11, 12};
    CHECK_FALSE(t.on_opponent_removed(10, remaining));
    CHECK(t.highlighted_index() == 1);
    CHECK(t.highlighted_id(remaining) == 12);

    const std::vector<CombatantId> last{11};
    (void)t.on_opponent_removed(12, last);
    CHECK(t.highlighted_id(last) == 11);
}

TEST_CASE("TargetingCoordinator: reset always lands in Free")
{
    TargetingCoordinator t;
    const std::vector<CombatantId> roster{10};
    REQUIRE(t.begin_selection());
    REQUIRE(t.confirm(roster));

    t.reset();
    CHECK(t.state() == TargetingState::Free);
    CHECK(t.locked_id() == kInvalidCombatant);
    CHECK(t.highlighted_index() == 0);
}
