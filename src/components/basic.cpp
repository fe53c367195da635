#include "carrom/components/basic.hpp"

namespace Components {

const char* kindName(DiscKind kind) {
    switch (kind) {
        case DiscKind::RegularLight: return "light coin";
        case DiscKind::RegularDark:  return "dark coin";
        case DiscKind::Queen:        return "queen";
        case DiscKind::Striker:      return "striker";
        default: return "unknown";
    }
}

} // namespace Components
