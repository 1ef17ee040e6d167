#include "Types.hpp"

namespace Schaak {

std::string Coordinate::toString() const {
    std::string text;
    text += static_cast<char>(file + 97);
    text += static_cast<char>(rank + 49);
    return text;
}

std::optional<Coordinate> Coordinate::fromString(std::string_view text) {
    if (text.size() != 2) {
        return std::nullopt;
    }

    Coordinate coord = {text[0] - 'a', text[1] - '1'};
    if (!coord.isValid()) {
        return std::nullopt;
    }
    return coord;
}

} // namespace Schaak
