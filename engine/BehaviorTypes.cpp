#include "engine/BehaviorTypes.hpp"

namespace ward {

const std::string& BehaviorEvent::Attr(const std::string& key) const {
    static const std::string empty;
    auto it = attributes.find(key);
    return it != attributes.end() ? it->second : empty;
}

} // namespace ward
