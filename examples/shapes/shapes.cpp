#include "shapes.hpp"

#include <boost/math/constants/constants.hpp>
#include <sstream>

#include "sprout/annotations/component_registry.hpp"

namespace examples::shapes {

double Circle::area() const {
    return boost::math::constants::pi<double>() * radius_ * radius_;
}

std::string ShapeService::describe_shapes() const {
    std::ostringstream oss;
    auto append = [this, &oss](const Shape& shape) {
        oss << shape.name() << ": " << shape.area();
        if (units_) {
            oss << " " << units_->suffix();
        }
        oss << "\n";
    };
    append(*circle_);
    append(*rectangle_);
    return oss.str();
}

std::string ShapePrinter::print() const {
    if (!service_) {
        return "no shape service\n";
    }
    return service_->describe_shapes();
}

SPROUT_NAMED_COMPONENT_AS(Circle, Shape, "examples::shapes", "circle");
SPROUT_COMPONENT(Rectangle, "examples::shapes");
SPROUT_COMPONENT(Units, "examples::shapes::units");
SPROUT_COMPONENT(ShapeService, "examples::shapes");
SPROUT_COMPONENT(ShapePrinter, "examples::shapes");

}  // namespace examples::shapes
