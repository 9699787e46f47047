#include "tcc/game/faction.hpp"

namespace tcc::game {

void FactionTable::SetHostile(FactionId a, FactionId b, bool hostile) {
    if (a == b || a == kNeutralFaction || b == kNeutralFaction) {
        return;
    }
    if (hostile) {
        pairs_.insert(Key(a, b));
    } else {
        pairs_.erase(Key(a, b));
    }
}

bool FactionTable::IsHostile(FactionId a, FactionId b) const {
    if (a == b || a == kNeutralFaction || b == kNeutralFaction) {
        return false;
    }
    return pairs_.count(Key(a, b)) > 0;
}

} // namespace tcc::game
