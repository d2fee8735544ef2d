#include "brazier/Items.h"

namespace brazier::items {

std::string_view ItemName(int id) noexcept
{
    switch (id)
    {
    case kBrumaRoot: return "Bruma root";
    case kBrumaKindling: return "Bruma kindling";
    case kSupplyCrate: return "Supply crate";
    case kRejuvenationUnf: return "Rejuvenation potion (unf)";
    case kBrumaHerb: return "Bruma herb";
    case kRejuvenation4: return "Rejuvenation potion (4)";
    case kRejuvenation3: return "Rejuvenation potion (3)";
    case kRejuvenation2: return "Rejuvenation potion (2)";
    case kRejuvenation1: return "Rejuvenation potion (1)";
    case kKnife: return "Knife";
    case kTinderbox: return "Tinderbox";
    case kHammer: return "Hammer";
    case 1351: return "Bronze axe";
    case 1349: return "Iron axe";
    case 1353: return "Steel axe";
    case 1361: return "Black axe";
    case 1355: return "Mithril axe";
    case 1357: return "Adamant axe";
    case 1359: return "Rune axe";
    case 6739: return "Dragon axe";
    case 13241: return "Infernal axe";
    case 23673: return "Crystal axe";
    case 20704: return "Pyromancer garb";
    case 20706: return "Pyromancer robe";
    case 20708: return "Pyromancer hood";
    case 20710: return "Pyromancer boots";
    case 20712: return "Warm gloves";
    case 20714: return "Tome of fire";
    case 20720: return "Bruma torch";
    case 1050: return "Santa hat";
    case 6570: return "Fire cape";
    case 21295: return "Infernal cape";
    case 9069: return "Moonclan hat";
    case 10069: return "Spotted cape";
    case 329: return "Salmon";
    case 333: return "Trout";
    case 361: return "Tuna";
    case 373: return "Swordfish";
    case 379: return "Lobster";
    case 385: return "Shark";
    case 1891: return "Cake";
    case 1993: return "Jug of wine";
    case 7946: return "Monkfish";
    default: break;
    }
    return "Unknown item";
}

} // namespace brazier::items
