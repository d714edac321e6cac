#pragma once

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>


namespace wirelink::examples {

// Small application payload used by the examples
struct Greeting {
    std::string type{"greeting"};
    std::string content;

    friend bool operator==(const Greeting&, const Greeting&) = default;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Greeting, type, content)

inline std::ostream& operator<<(std::ostream& os, const Greeting& g) {
    return os << "[Greeting] type=" << g.type << " content=" << g.content;
}

} // namespace wirelink::examples
