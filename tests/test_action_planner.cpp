// tests/test_action_planner.cpp
//
// Coverage for NextResourceAction().

#include <doctest/doctest.h>

#include "brazier/ActionPlanner.h"

#include <string>

using brazier::PlannerAction;

TEST_CASE("NextResourceAction never gathers on a full inventory")
{
    for (int mask = 0; mask < 8; ++mask)
    {
        const bool raw = (mask & 1) != 0;
        const bool kindling = (mask & 2) != 0;
        const bool fletch = (mask & 4) != 0;
        CAPTURE(mask);
        CHECK(brazier::NextResourceAction(raw, kindling, /*full=*/true, fletch) == PlannerAction::Deposit);
    }
}

TEST_CASE("NextResourceAction follows the fixed decision order")
{
    // Kindling always goes into the brazier first.
    CHECK(brazier::NextResourceAction(true, true, false, true) == PlannerAction::Deposit);
    CHECK(brazier::NextResourceAction(false, true, false, false) == PlannerAction::Deposit);

    // Roots: fletch when enabled, feed directly otherwise.
    CHECK(brazier::NextResourceAction(true, false, false, true) == PlannerAction::Convert);
    CHECK(brazier::NextResourceAction(true, false, false, false) == PlannerAction::Deposit);

    // Nothing carried: chop.
    CHECK(brazier::NextResourceAction(false, false, false, true) == PlannerAction::Gather);
    CHECK(brazier::NextResourceAction(false, false, false, false) == PlannerAction::Gather);
}

TEST_CASE("PlannerActionName")
{
    CHECK(std::string(brazier::PlannerActionName(PlannerAction::Gather)) == "gather");
    CHECK(std::string(brazier::PlannerActionName(PlannerAction::Convert)) == "convert");
    CHECK(std::string(brazier::PlannerActionName(PlannerAction::Deposit)) == "deposit");
}
