#ifndef CORE2D_COMPONENTS_SHAPE_HPP
#define CORE2D_COMPONENTS_SHAPE_HPP

#include <variant>

namespace Components {

    struct Circle {
        double radius = 1.0;

        explicit Circle(double r = 1.0) : radius(r) {}
    };

    // Tagged union over every supported geometry. Adding a variant here makes
    // every std::visit over Shape (AABB refresh, narrow phase) fail to compile
    // until it is handled.
    using Shape = std::variant<Circle>;

    inline const char *shapeName(const Circle &) { return "Circle"; }

    inline const char *shapeName(const Shape &shape) {
        return std::visit([](const auto &s) { return shapeName(s); }, shape);
    }

} // namespace Components

#endif
