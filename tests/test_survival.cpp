// tests/test_survival.cpp
//
// Coverage for dose accounting, best-unit selection, ReadResourceState() and
// the ShouldDrinkOrEat() decision.

#include <doctest/doctest.h>

#include "brazier/Items.h"
#include "brazier/Survival.h"

#include <vector>

namespace items = brazier::items;
using brazier::SurvivalStrategy;
using brazier::WarmthAction;

TEST_CASE("TotalDoses weighs potions by remaining doses")
{
    const std::vector<int> inv{
        items::kRejuvenation4, items::kRejuvenation2, items::kRejuvenation1,
        items::kRejuvenationUnf, items::kBrumaHerb, items::kEmptySlot, 329,
    };

    CHECK(brazier::TotalDoses(inv, SurvivalStrategy::Crafted) == 7);
    CHECK(brazier::TotalDoses(inv, SurvivalStrategy::Stocked) == 1); // the salmon
}

TEST_CASE("TotalDoses is the sum over the parts of an inventory")
{
    const std::vector<int> a{ items::kRejuvenation3, items::kRejuvenation3, items::kBrumaRoot };
    const std::vector<int> b{ items::kRejuvenation4, items::kRejuvenation1, 385 };

    std::vector<int> both = a;
    both.insert(both.end(), b.begin(), b.end());

    for (const auto strategy : { SurvivalStrategy::Crafted, SurvivalStrategy::Stocked })
    {
        CHECK(brazier::TotalDoses(both, strategy)
              == brazier::TotalDoses(a, strategy) + brazier::TotalDoses(b, strategy));
    }
}

TEST_CASE("BestSurvivalUnitSlot prefers the fullest unit, first slot on ties")
{
    const std::vector<int> inv{
        items::kBrumaRoot, items::kRejuvenation2, items::kRejuvenation4,
        items::kRejuvenation4, items::kRejuvenation1,
    };
    const auto slot = brazier::BestSurvivalUnitSlot(inv, SurvivalStrategy::Crafted);
    REQUIRE(slot.has_value());
    CHECK(*slot == 2);

    const std::vector<int> food{ items::kTinderbox, 329, 385 };
    const auto first = brazier::BestSurvivalUnitSlot(food, SurvivalStrategy::Stocked);
    REQUIRE(first.has_value());
    CHECK(*first == 1);

    const std::vector<int> none{ items::kBrumaRoot, items::kRejuvenationUnf };
    CHECK_FALSE(brazier::BestSurvivalUnitSlot(none, SurvivalStrategy::Crafted).has_value());
}

TEST_CASE("ShouldDrinkOrEat waits for the threshold and reports exhaustion")
{
    CHECK(brazier::ShouldDrinkOrEat(0, 3, true) == WarmthAction::NoneNeeded);
    CHECK(brazier::ShouldDrinkOrEat(2, 3, false) == WarmthAction::NoneNeeded);
    CHECK(brazier::ShouldDrinkOrEat(3, 3, true) == WarmthAction::Consume);
    CHECK(brazier::ShouldDrinkOrEat(5, 3, true) == WarmthAction::Consume);
    CHECK(brazier::ShouldDrinkOrEat(3, 3, false) == WarmthAction::Exhausted);

    // A zero threshold behaves like one: a single hit is enough.
    CHECK(brazier::ShouldDrinkOrEat(0, 0, true) == WarmthAction::NoneNeeded);
    CHECK(brazier::ShouldDrinkOrEat(1, 0, true) == WarmthAction::Consume);
}

TEST_CASE("ReadResourceState counts materials, free slots and loot")
{
    std::vector<int> inv(items::kInventorySlots, items::kEmptySlot);
    inv[0] = items::kTinderbox;
    inv[1] = items::kHammer;
    inv[2] = items::kBrumaRoot;
    inv[3] = items::kBrumaRoot;
    inv[4] = items::kBrumaKindling;
    inv[5] = items::kRejuvenation3;
    inv[6] = items::kRejuvenationUnf;
    inv[7] = items::kBrumaHerb;

    const auto rs = brazier::ReadResourceState(inv, false, SurvivalStrategy::Crafted);
    CHECK(rs.rawMaterial == 2);
    CHECK(rs.intermediate == 1);
    CHECK(rs.survivalUnits == 1);
    CHECK(rs.doses == 3);
    CHECK(rs.containers == 1);
    CHECK(rs.ingredients == 1);
    CHECK(rs.freeSlots == items::kInventorySlots - 8);
    CHECK(rs.hasLoot); // roots and kindling are not protected
    CHECK_FALSE(rs.inventoryFull);

    std::vector<int> clean(items::kInventorySlots, items::kEmptySlot);
    clean[0] = items::kKnife;
    clean[1] = 1359; // rune axe
    clean[2] = 329;
    CHECK_FALSE(brazier::ReadResourceState(clean, false, SurvivalStrategy::Stocked).hasLoot);
    CHECK(rs.rewardItems == 0);
}

TEST_CASE("ReadResourceState counts reward crates apart from roots and kindling")
{
    std::vector<int> inv(items::kInventorySlots, items::kEmptySlot);
    inv[0] = items::kSupplyCrate;
    inv[1] = items::kBrumaRoot;
    inv[2] = items::kBrumaKindling;
    inv[3] = items::kSupplyCrate;
    inv[4] = items::kKnife;

    const auto rs = brazier::ReadResourceState(inv, false, SurvivalStrategy::Crafted);
    CHECK(rs.rewardItems == 2);
    CHECK(rs.hasLoot);
    CHECK(rs.rawMaterial == 1);
    CHECK(rs.intermediate == 1);
}

TEST_CASE("ParseSurvivalStrategy accepts names and aliases")
{
    CHECK(brazier::ParseSurvivalStrategy("stocked") == SurvivalStrategy::Stocked);
    CHECK(brazier::ParseSurvivalStrategy("FOOD") == SurvivalStrategy::Stocked);
    CHECK(brazier::ParseSurvivalStrategy("Crafted") == SurvivalStrategy::Crafted);
    CHECK(brazier::ParseSurvivalStrategy("potions") == SurvivalStrategy::Crafted);
    CHECK_FALSE(brazier::ParseSurvivalStrategy("herbs").has_value());
    CHECK(brazier::FullDoseValue(SurvivalStrategy::Crafted) == 4);
    CHECK(brazier::FullDoseValue(SurvivalStrategy::Stocked) == 1);
}
