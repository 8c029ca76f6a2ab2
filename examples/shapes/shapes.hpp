#pragma once

#include <memory>
#include <string>

#include "sprout/di/component_descriptor.hpp"

namespace examples::shapes {

class Shape {
public:
    virtual ~Shape() = default;
    virtual std::string name() const = 0;
    virtual double area() const = 0;
};

class Circle : public Shape {
public:
    std::string name() const override { return "circle"; }
    double area() const override;

private:
    double radius_ = 1.0;
};

class Rectangle : public Shape {
public:
    std::string name() const override { return "rectangle"; }
    double area() const override { return width_ * height_; }

private:
    double width_ = 2.0;
    double height_ = 3.0;
};

// Unit used when printing areas
class Units {
public:
    const std::string& suffix() const { return suffix_; }

private:
    std::string suffix_ = "cm^2";
};

class ShapeService {
public:
    static void describe(sprout::di::ComponentDescriptorBuilder<ShapeService>& b) {
        b.inject_constructor<Shape, Rectangle>({"circle"})
            .inject_field("units_", &ShapeService::units_);
    }

    std::string describe_shapes() const;

    const std::shared_ptr<Shape>& circle() const { return circle_; }
    const std::shared_ptr<Rectangle>& rectangle() const { return rectangle_; }

private:
    friend class sprout::di::ConstructorAccess;

    ShapeService(std::shared_ptr<Shape> circle,
                 std::shared_ptr<Rectangle> rectangle)
        : circle_(std::move(circle)), rectangle_(std::move(rectangle)) {}

    std::shared_ptr<Shape> circle_;
    std::shared_ptr<Rectangle> rectangle_;
    std::shared_ptr<Units> units_;
};

// Prints the shapes it is handed through setter injection
class ShapePrinter {
public:
    static void describe(sprout::di::ComponentDescriptorBuilder<ShapePrinter>& b) {
        b.inject_method("set_service", &ShapePrinter::set_service);
    }

    void set_service(std::shared_ptr<ShapeService> service) {
        service_ = std::move(service);
    }

    std::string print() const;

private:
    std::shared_ptr<ShapeService> service_;
};

}  // namespace examples::shapes
