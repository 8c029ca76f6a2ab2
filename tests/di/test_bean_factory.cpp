// tests/di/test_bean_factory.cpp
#define BOOST_TEST_MODULE bean_factory_tests
#include <boost/test/unit_test.hpp>
#include <memory>
#include <stdexcept>
#include <string>

#include "sprout/di/bean_factory.hpp"

using namespace sprout::di;

// =====================================
// Test components
// =====================================

struct Repository {
    int id = 7;
};

class Service {
public:
    static void describe(ComponentDescriptorBuilder<Service>& b) {
        b.inject_constructor<Repository>();
    }

    explicit Service(std::shared_ptr<Repository> repository)
        : repository(std::move(repository)) {}

    std::shared_ptr<Repository> repository;
};

struct Shape {
    virtual ~Shape() = default;
    virtual std::string name() const = 0;
};

struct Circle : Shape {
    std::string name() const override { return "circle"; }
};

struct Square : Shape {
    std::string name() const override { return "square"; }
};

class Drawing {
public:
    static void describe(ComponentDescriptorBuilder<Drawing>& b) {
        b.inject_constructor<Shape>({"square"});
    }

    explicit Drawing(std::shared_ptr<Shape> shape) : shape(std::move(shape)) {}

    std::shared_ptr<Shape> shape;
};

struct TwoMarked {
    static void describe(ComponentDescriptorBuilder<TwoMarked>& b) {
        b.inject_constructor<>().inject_constructor<Repository>();
    }

    TwoMarked() = default;
    explicit TwoMarked(std::shared_ptr<Repository>) {}
};

struct Fallback {
    static void describe(ComponentDescriptorBuilder<Fallback>& b) {
        b.constructor<Repository>();
    }

    Fallback() = default;
    explicit Fallback(std::shared_ptr<Repository> repository)
        : repository(std::move(repository)) {}

    std::shared_ptr<Repository> repository;
};

struct NoDefault {
    static void describe(ComponentDescriptorBuilder<NoDefault>& b) {
        b.constructor<Repository>();
    }

    explicit NoDefault(std::shared_ptr<Repository>) {}
};

class Hidden {
public:
    static void describe(ComponentDescriptorBuilder<Hidden>& b) {
        b.constructor<>();
    }

    inline static int created = 0;

private:
    friend class sprout::di::ConstructorAccess;
    Hidden() { ++created; }
};

struct CycleB;

struct CycleA {
    static void describe(ComponentDescriptorBuilder<CycleA>& b);
    explicit CycleA(std::shared_ptr<CycleB> b) : b(std::move(b)) {}
    std::shared_ptr<CycleB> b;
};

struct CycleB {
    static void describe(ComponentDescriptorBuilder<CycleB>& b) {
        b.inject_constructor<CycleA>();
    }
    explicit CycleB(std::shared_ptr<CycleA> a) : a(std::move(a)) {}
    std::shared_ptr<CycleA> a;
};

void CycleA::describe(ComponentDescriptorBuilder<CycleA>& b) {
    b.inject_constructor<CycleB>();
}

struct FieldB;

struct FieldA {
    static void describe(ComponentDescriptorBuilder<FieldA>& b);
    std::shared_ptr<FieldB> b;
};

struct FieldB {
    static void describe(ComponentDescriptorBuilder<FieldB>& b) {
        b.inject_constructor<FieldA>();
    }
    explicit FieldB(std::shared_ptr<FieldA> a) : a(std::move(a)) {}
    std::shared_ptr<FieldA> a;
};

void FieldA::describe(ComponentDescriptorBuilder<FieldA>& b) {
    b.inject_field("b", &FieldA::b);
}

struct ConstField {
    static void describe(ComponentDescriptorBuilder<ConstField>& b) {
        b.inject_field("repository", &ConstField::repository);
    }
    const std::shared_ptr<Repository> repository;
};

struct StaticField {
    static void describe(ComponentDescriptorBuilder<StaticField>& b) {
        b.inject_field("repository", &StaticField::repository);
    }
    inline static std::shared_ptr<Repository> repository;
};

struct Missing {};

struct Fragile {
    static void describe(ComponentDescriptorBuilder<Fragile>& b) {
        b.inject_method("set_missing", &Fragile::set_missing);
    }
    void set_missing(std::shared_ptr<Missing> missing) {
        this->missing = std::move(missing);
    }
    std::shared_ptr<Missing> missing;
};

class Client {
public:
    static void describe(ComponentDescriptorBuilder<Client>& b) {
        b.inject_method("set_repository", &Client::set_repository)
            .inject_method("configure", &Client::configure)
            .inject_method("set_pair", &Client::set_pair)
            .inject_method("set_global", &Client::set_global);
    }

    void set_repository(std::shared_ptr<Repository> repository) {
        this->repository = std::move(repository);
    }
    void configure(std::shared_ptr<Repository> repository) {
        configured = std::move(repository);
    }
    void set_pair(std::shared_ptr<Repository>, std::shared_ptr<Repository>) {
        pair_called = true;
    }
    static void set_global(std::shared_ptr<Repository> repository) {
        global = std::move(repository);
    }

    std::shared_ptr<Repository> repository;
    std::shared_ptr<Repository> configured;
    bool pair_called = false;
    inline static std::shared_ptr<Repository> global;
};

struct PairClient {
    static void describe(ComponentDescriptorBuilder<PairClient>& b) {
        b.inject_method("set_pair", &PairClient::set_pair);
    }
    void set_pair(std::shared_ptr<Repository>, std::shared_ptr<Repository>) {}
};

struct Exploding {
    Exploding() { throw std::runtime_error("boom"); }
};

struct NeedsExploding {
    static void describe(ComponentDescriptorBuilder<NeedsExploding>& b) {
        b.inject_constructor<Exploding>();
    }
    explicit NeedsExploding(std::shared_ptr<Exploding>) {}
};

// Decorates another qualified implementation of the interface it is exposed as
struct Framed : Shape {
    static void describe(ComponentDescriptorBuilder<Framed>& b) {
        b.inject_constructor<Shape>({"circle"});
    }
    explicit Framed(std::shared_ptr<Shape> inner) : inner(std::move(inner)) {}
    std::string name() const override { return "framed " + inner->name(); }
    std::shared_ptr<Shape> inner;
};

struct Holder;

// Field "holder" builds a Holder that captures this bean; field "missing"
// then fails
struct Owner {
    static void describe(ComponentDescriptorBuilder<Owner>& b);
    std::shared_ptr<Holder> holder;
    std::shared_ptr<Missing> missing;
};

struct Holder {
    static void describe(ComponentDescriptorBuilder<Holder>& b) {
        b.inject_constructor<Owner>();
    }
    explicit Holder(std::shared_ptr<Owner> owner) : owner(std::move(owner)) {}
    std::shared_ptr<Owner> owner;
};

void Owner::describe(ComponentDescriptorBuilder<Owner>& b) {
    b.inject_field("holder", &Owner::holder)
        .inject_field("missing", &Owner::missing);
}

struct Shared {
    Shared() { ++constructed; }
    inline static int constructed = 0;
};

struct UserX {
    static void describe(ComponentDescriptorBuilder<UserX>& b) {
        b.inject_constructor<Shared>();
    }
    explicit UserX(std::shared_ptr<Shared> shared) : shared(std::move(shared)) {}
    std::shared_ptr<Shared> shared;
};

struct UserY {
    static void describe(ComponentDescriptorBuilder<UserY>& b) {
        b.inject_constructor<Shared>();
    }
    explicit UserY(std::shared_ptr<Shared> shared) : shared(std::move(shared)) {}
    std::shared_ptr<Shared> shared;
};

struct FactoryFixture {
    std::shared_ptr<DefaultBeanRegistry> registry =
        std::make_shared<DefaultBeanRegistry>();
    BeanFactory factory{registry};

    // Root cause of a failed construction
    ErrorCode failure_of(const BeanDefinition& definition) {
        try {
            factory.create_bean(definition);
        } catch (const BeanInstantiationException& e) {
            return e.root_cause();
        }
        BOOST_FAIL("expected BeanInstantiationException");
        return ErrorCode::INSTANTIATION_FAILED;
    }
};

BOOST_FIXTURE_TEST_SUITE(bean_factory_suite, FactoryFixture)

// =====================================
// Constructor injection
// =====================================

BOOST_AUTO_TEST_CASE(test_default_constructor_singleton_is_registered) {
    auto bean = factory.create_bean<Repository>(BeanDefinition::of<Repository>());

    BOOST_REQUIRE(bean);
    BOOST_CHECK_EQUAL(bean->id, 7);
    BOOST_CHECK_EQUAL(registry->resolve<Repository>().get(), bean.get());
}

BOOST_AUTO_TEST_CASE(test_singleton_is_created_once) {
    auto definition = BeanDefinition::of<Repository>();

    auto first = factory.create_bean(definition);
    auto second = factory.create_bean(definition);

    BOOST_CHECK_EQUAL(first.get(), second.get());
    BOOST_CHECK_EQUAL(registry->get_qualifiers<Repository>().size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_registered_singleton_short_circuits_construction) {
    auto existing = std::make_shared<NoDefault>(nullptr);
    registry->register_bean(existing);

    auto bean = factory.create_bean<NoDefault>(BeanDefinition::of<NoDefault>());
    BOOST_CHECK_EQUAL(bean.get(), existing.get());
}

BOOST_AUTO_TEST_CASE(test_prototype_is_not_registered) {
    auto definition = BeanDefinition::of<Repository>(std::nullopt, false);

    auto first = factory.create_bean(definition);
    auto second = factory.create_bean(definition);

    BOOST_CHECK_NE(first.get(), second.get());
    BOOST_CHECK(!registry->contains_bean<Repository>());
}

BOOST_AUTO_TEST_CASE(test_qualified_definition_registers_under_qualifier) {
    factory.create_bean(BeanDefinition::of<Repository>("primary"));

    BOOST_CHECK(registry->contains_bean<Repository>("primary"));
    BOOST_CHECK(!registry->contains_bean<Repository>());
}

BOOST_AUTO_TEST_CASE(test_marked_constructor_receives_registered_dependency) {
    auto repository = std::make_shared<Repository>();
    registry->register_bean(repository);

    auto service = factory.create_bean<Service>(BeanDefinition::of<Service>());
    BOOST_CHECK_EQUAL(service->repository.get(), repository.get());
}

BOOST_AUTO_TEST_CASE(test_dependency_is_built_from_known_definition) {
    factory.register_definition(BeanDefinition::of<Repository>());

    auto service = factory.create_bean<Service>(BeanDefinition::of<Service>());

    BOOST_REQUIRE(service->repository);
    BOOST_CHECK_EQUAL(registry->resolve<Repository>().get(),
                      service->repository.get());
}

BOOST_AUTO_TEST_CASE(test_qualified_parameter_selects_named_bean) {
    factory.create_bean(BeanDefinition::of<Circle, Shape>("circle"));
    factory.create_bean(BeanDefinition::of<Square, Shape>("square"));

    auto drawing = factory.create_bean<Drawing>(BeanDefinition::of<Drawing>());
    BOOST_CHECK_EQUAL(drawing->shape->name(), "square");
}

BOOST_AUTO_TEST_CASE(test_exposed_bean_is_keyed_by_interface) {
    auto shape = factory.create_bean<Shape>(BeanDefinition::of<Circle, Shape>());

    BOOST_CHECK_EQUAL(shape->name(), "circle");
    BOOST_CHECK(registry->contains_bean<Shape>());
    BOOST_CHECK(!registry->contains_bean<Circle>());
}

BOOST_AUTO_TEST_CASE(test_decorator_of_same_interface_is_not_a_cycle) {
    factory.register_definition(BeanDefinition::of<Circle, Shape>("circle"));

    auto shape = factory.create_bean<Shape>(
        BeanDefinition::of<Framed, Shape>("framed"));

    BOOST_CHECK_EQUAL(shape->name(), "framed circle");
    BOOST_CHECK_EQUAL(registry->resolve<Shape>("circle").get(),
                      static_cast<Framed*>(shape.get())->inner.get());
    BOOST_CHECK_EQUAL(registry->resolve<Shape>("framed").get(), shape.get());
}

BOOST_AUTO_TEST_CASE(test_roots_share_registered_dependency) {
    Shared::constructed = 0;
    factory.register_definition(BeanDefinition::of<Shared>());

    auto x = factory.create_bean<UserX>(BeanDefinition::of<UserX>());
    auto y = factory.create_bean<UserY>(BeanDefinition::of<UserY>());

    BOOST_REQUIRE(x->shared);
    BOOST_CHECK_EQUAL(x->shared.get(), y->shared.get());
    BOOST_CHECK_EQUAL(registry->resolve<Shared>().get(), x->shared.get());
    BOOST_CHECK_EQUAL(Shared::constructed, 1);
}

BOOST_AUTO_TEST_CASE(test_typed_create_rejects_other_type) {
    BOOST_CHECK_THROW(
        factory.create_bean<Repository>(BeanDefinition::of<Service>()),
        InvalidArgumentException);
}

BOOST_AUTO_TEST_CASE(test_private_constructor_is_reachable) {
    Hidden::created = 0;
    auto bean = factory.create_bean<Hidden>(BeanDefinition::of<Hidden>());

    BOOST_CHECK(bean);
    BOOST_CHECK_EQUAL(Hidden::created, 1);
}

// =====================================
// Constructor selection
// =====================================

BOOST_AUTO_TEST_CASE(test_two_marked_constructors_are_ambiguous) {
    BOOST_CHECK(failure_of(BeanDefinition::of<TwoMarked>()) ==
                ErrorCode::AMBIGUOUS_CONSTRUCTOR);
    BOOST_CHECK(!registry->contains_bean<TwoMarked>());
}

BOOST_AUTO_TEST_CASE(test_unmarked_type_falls_back_to_zero_arg_constructor) {
    auto bean = factory.create_bean<Fallback>(BeanDefinition::of<Fallback>());

    BOOST_CHECK(bean);
    BOOST_CHECK(!bean->repository);
}

BOOST_AUTO_TEST_CASE(test_no_viable_constructor) {
    try {
        factory.create_bean(BeanDefinition::of<NoDefault>());
        BOOST_FAIL("expected BeanInstantiationException");
    } catch (const BeanInstantiationException& e) {
        BOOST_CHECK(e.root_cause() == ErrorCode::NO_VIABLE_CONSTRUCTOR);
        BOOST_CHECK(e.bean_type() == TypeRef::of<NoDefault>());
        BOOST_CHECK_THROW(e.rethrow_cause(), NoViableConstructorException);
    }
}

// =====================================
// Failures
// =====================================

BOOST_AUTO_TEST_CASE(test_missing_dependency_is_not_found) {
    BOOST_CHECK(failure_of(BeanDefinition::of<Service>()) ==
                ErrorCode::NOT_FOUND);
    BOOST_CHECK(!registry->contains_bean<Service>());
}

BOOST_AUTO_TEST_CASE(test_constructor_cycle_is_detected) {
    factory.register_definitions(
        {BeanDefinition::of<CycleA>(), BeanDefinition::of<CycleB>()});

    try {
        factory.create_bean(BeanDefinition::of<CycleA>());
        BOOST_FAIL("expected BeanInstantiationException");
    } catch (const BeanInstantiationException& e) {
        BOOST_CHECK(e.root_cause() == ErrorCode::CYCLIC_DEPENDENCY);
        try {
            e.rethrow_cause();
        } catch (const CyclicDependencyException& cycle) {
            BOOST_CHECK(cycle.type() == TypeRef::of<CycleA>());
            BOOST_REQUIRE_EQUAL(cycle.chain().size(), 2u);
            BOOST_CHECK(cycle.chain()[0] == TypeRef::of<CycleA>());
            BOOST_CHECK(cycle.chain()[1] == TypeRef::of<CycleB>());
        }
    }

    BOOST_CHECK(!registry->contains_bean<CycleA>());
    BOOST_CHECK(!registry->contains_bean<CycleB>());
}

BOOST_AUTO_TEST_CASE(test_context_is_unwound_after_failure) {
    factory.register_definitions(
        {BeanDefinition::of<CycleA>(), BeanDefinition::of<CycleB>()});

    ConstructionContext context;
    BOOST_CHECK_THROW(factory.create_bean(BeanDefinition::of<CycleA>(), context),
                      BeanInstantiationException);
    BOOST_CHECK_EQUAL(context.depth(), 0u);
    BOOST_CHECK(!context.is_constructing(TypeRef::of<CycleA>()));

    BOOST_CHECK_NO_THROW(
        factory.create_bean(BeanDefinition::of<Repository>(), context));
}

BOOST_AUTO_TEST_CASE(test_cycle_through_field_injection_resolves) {
    factory.register_definitions(
        {BeanDefinition::of<FieldA>(), BeanDefinition::of<FieldB>()});

    auto a = factory.create_bean<FieldA>(BeanDefinition::of<FieldA>());

    BOOST_REQUIRE(a->b);
    BOOST_CHECK_EQUAL(a->b->a.get(), a.get());
    BOOST_CHECK_EQUAL(registry->resolve<FieldB>().get(), a->b.get());

    // Break the reference cycle
    a->b->a.reset();
}

BOOST_AUTO_TEST_CASE(test_nested_failure_is_not_rewrapped) {
    factory.register_definition(BeanDefinition::of<Exploding>());

    try {
        factory.create_bean(BeanDefinition::of<NeedsExploding>());
        BOOST_FAIL("expected BeanInstantiationException");
    } catch (const BeanInstantiationException& e) {
        BOOST_CHECK(e.bean_type() == TypeRef::of<Exploding>());
        BOOST_CHECK(e.root_cause() == ErrorCode::INSTANTIATION_FAILED);
        BOOST_CHECK(std::string(e.what()).find("boom") != std::string::npos);
        BOOST_CHECK_THROW(e.rethrow_cause(), std::runtime_error);
    }
    BOOST_CHECK(!registry->contains_bean<NeedsExploding>());
}

// =====================================
// Field injection
// =====================================

BOOST_AUTO_TEST_CASE(test_const_field_is_invalid_target) {
    registry->register_bean(std::make_shared<Repository>());

    BOOST_CHECK(failure_of(BeanDefinition::of<ConstField>()) ==
                ErrorCode::INVALID_TARGET);
    BOOST_CHECK(!registry->contains_bean<ConstField>());
}

BOOST_AUTO_TEST_CASE(test_static_field_is_invalid_target) {
    registry->register_bean(std::make_shared<Repository>());

    BOOST_CHECK(failure_of(BeanDefinition::of<StaticField>()) ==
                ErrorCode::INVALID_TARGET);
    BOOST_CHECK(!StaticField::repository);
}

// =====================================
// Setter injection
// =====================================

BOOST_AUTO_TEST_CASE(test_only_conforming_setters_are_invoked) {
    auto repository = std::make_shared<Repository>();
    registry->register_bean(repository);
    Client::global.reset();

    auto client = factory.create_bean<Client>(BeanDefinition::of<Client>());

    BOOST_CHECK_EQUAL(client->repository.get(), repository.get());
    BOOST_CHECK(!client->configured);
    BOOST_CHECK(!client->pair_called);
    BOOST_CHECK(!Client::global);
}

BOOST_AUTO_TEST_CASE(test_failed_setter_withdraws_singleton) {
    BOOST_CHECK(failure_of(BeanDefinition::of<Fragile>()) ==
                ErrorCode::NOT_FOUND);
    BOOST_CHECK(!registry->contains_bean<Fragile>());
    BOOST_CHECK_EQUAL(registry->type_count(), 0u);
}

BOOST_AUTO_TEST_CASE(test_failed_injection_withdraws_beans_holding_the_bean) {
    factory.register_definition(BeanDefinition::of<Holder>());

    BOOST_CHECK(failure_of(BeanDefinition::of<Owner>()) == ErrorCode::NOT_FOUND);

    BOOST_CHECK(!registry->contains_bean<Owner>());
    BOOST_CHECK(!registry->contains_bean<Holder>());
    BOOST_CHECK_EQUAL(registry->type_count(), 0u);

    // A retry builds one consistent pair
    registry->register_bean(std::make_shared<Missing>());
    auto owner = factory.create_bean<Owner>(BeanDefinition::of<Owner>());
    BOOST_REQUIRE(owner->holder);
    BOOST_CHECK_EQUAL(owner->holder->owner.get(), owner.get());
    BOOST_CHECK_EQUAL(registry->resolve<Holder>().get(), owner->holder.get());

    owner->holder->owner.reset();
}

BOOST_AUTO_TEST_CASE(test_strict_mode_rejects_non_conforming_setter) {
    BeanFactory strict(registry, BeanFactoryOptions{true});

    try {
        strict.create_bean(BeanDefinition::of<PairClient>());
        BOOST_FAIL("expected BeanInstantiationException");
    } catch (const BeanInstantiationException& e) {
        BOOST_CHECK(e.root_cause() == ErrorCode::INVALID_TARGET);
        BOOST_CHECK_THROW(e.rethrow_cause(), InvalidTargetException);
    }
    BOOST_CHECK(!registry->contains_bean<PairClient>());

    BOOST_CHECK_NO_THROW(factory.create_bean(BeanDefinition::of<PairClient>()));
}

BOOST_AUTO_TEST_CASE(test_setter_name_rule) {
    BOOST_CHECK(is_setter_name("set_repository"));
    BOOST_CHECK(is_setter_name("setRepository"));
    BOOST_CHECK(!is_setter_name("configure"));
    BOOST_CHECK(!is_setter_name("reset"));
}

BOOST_AUTO_TEST_SUITE_END()
