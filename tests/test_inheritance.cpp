#include <catch2/catch_test_macros.hpp>
#include <capdi.hpp>
#include <memory>
#include <string>

// ===============================================================
// Multiple Inheritance (MI) test fixtures
// ===============================================================

namespace {

// Live instance count, for destruction checks
static int g_alive = 0;

struct IAnimal {
    virtual ~IAnimal() = default;
    virtual std::string species() const = 0;
};

struct ISwimmable {
    virtual ~ISwimmable() = default;
    virtual int swim_speed() const = 0;
};

struct IFlyable {
    virtual ~IFlyable() = default;
    virtual int fly_speed() const = 0;
};

// MI: Duck implements both IAnimal and ISwimmable
struct Duck : IAnimal, ISwimmable {
    Duck() { ++g_alive; }
    ~Duck() override { --g_alive; }
    std::string species() const override { return "duck"; }
    int swim_speed() const override { return 5; }
};

// MI: FlyingFish implements IAnimal, ISwimmable, IFlyable (3 bases)
struct FlyingFish : IAnimal, ISwimmable, IFlyable {
    std::string species() const override { return "flying_fish"; }
    int swim_speed() const override { return 10; }
    int fly_speed() const override { return 3; }
};

// Consumer of a non-first base
struct IPond {
    virtual ~IPond() = default;
    virtual int fastest() const = 0;
};

struct Pond : IPond {
    std::shared_ptr<ISwimmable> swimmer;
    explicit Pond(std::shared_ptr<ISwimmable> s) : swimmer(std::move(s)) {}
    int fastest() const override { return swimmer->swim_speed(); }
};

// ===============================================================
// Virtual Inheritance (VI) test fixtures
// ===============================================================

struct IShape {
    virtual ~IShape() = default;
    virtual std::string shape_name() const = 0;
};

struct IDrawable : virtual IShape {
    virtual void draw() const = 0;
};

struct IResizable : virtual IShape {
    virtual void resize(int) const = 0;
};

// Diamond: both arms virtually inherit IShape -> single IShape subobject
struct DrawableResizableRect : IDrawable, IResizable {
    std::string shape_name() const override { return "rect"; }
    void draw() const override {}
    void resize(int) const override {}
};

struct VBase {
    virtual ~VBase() = default;
    virtual int id() const = 0;
};

struct VMid : virtual VBase {
    int id() const override { return 99; }
};

struct VLeaf : VMid {
    int id() const override { return 42; }
};

} // namespace

// ===============================================================
// MI: Basic registration and resolution
// ===============================================================

TEST_CASE("MI: register and resolve via first base (IAnimal)", "[inheritance][mi]") {
    capdi::container c;
    c.get_registry().add_singleton<IAnimal, Duck>();

    REQUIRE(c.resolve<IAnimal>()->species() == "duck");
}

TEST_CASE("MI: register and resolve via second base (ISwimmable)", "[inheritance][mi]") {
    capdi::container c;
    c.get_registry().add_singleton<ISwimmable, Duck>();

    REQUIRE(c.resolve<ISwimmable>()->swim_speed() == 5);
}

TEST_CASE("MI: register same impl under two interfaces independently", "[inheritance][mi]") {
    capdi::container c;
    c.get_registry().add_singleton<IAnimal, Duck>();
    c.get_registry().add_singleton<ISwimmable, Duck>();

    auto animal = c.resolve<IAnimal>();
    auto swimmer = c.resolve<ISwimmable>();
    REQUIRE(animal->species() == "duck");
    REQUIRE(swimmer->swim_speed() == 5);
    // Separate registrations produce separate singletons
    REQUIRE(dynamic_cast<Duck*>(animal.get()) != dynamic_cast<Duck*>(swimmer.get()));
}

TEST_CASE("MI: per_request via non-first base", "[inheritance][mi]") {
    capdi::container c;
    c.get_registry().add_per_request<ISwimmable, Duck>();

    auto a = c.resolve<ISwimmable>();
    auto b = c.resolve<ISwimmable>();
    REQUIRE(a->swim_speed() == 5);
    REQUIRE(b->swim_speed() == 5);
    REQUIRE(a.get() != b.get());
}

TEST_CASE("MI: three bases, resolve each independently", "[inheritance][mi]") {
    capdi::container c;
    c.get_registry().add_singleton<IAnimal, FlyingFish>();
    c.get_registry().add_singleton<ISwimmable, FlyingFish>();
    c.get_registry().add_singleton<IFlyable, FlyingFish>();

    REQUIRE(c.resolve<IAnimal>()->species() == "flying_fish");
    REQUIRE(c.resolve<ISwimmable>()->swim_speed() == 10);
    REQUIRE(c.resolve<IFlyable>()->fly_speed() == 3);
}

TEST_CASE("MI: non-first base injected into a consumer", "[inheritance][mi]") {
    capdi::container c;
    c.get_registry().add_singleton<ISwimmable, FlyingFish>();
    c.get_registry().add_per_request<IPond, Pond>(capdi::deps<ISwimmable>);

    REQUIRE(c.resolve<IPond>()->fastest() == 10);
}

TEST_CASE("MI: existing instance registered under a non-first base", "[inheritance][mi]") {
    auto duck = std::make_shared<Duck>();

    capdi::container c;
    c.get_registry().add_instance<ISwimmable>(duck);

    auto swimmer = c.resolve<ISwimmable>();
    REQUIRE(swimmer.get() == static_cast<ISwimmable*>(duck.get()));
    REQUIRE(swimmer->swim_speed() == 5);
}

TEST_CASE("MI: factory producing the impl type", "[inheritance][mi]") {
    capdi::container c;
    c.get_registry().add_factory<IFlyable>([] { return std::make_shared<FlyingFish>(); });

    REQUIRE(c.resolve<IFlyable>()->fly_speed() == 3);
}

// ===============================================================
// MI: Correct destruction
// ===============================================================

TEST_CASE("MI: singleton destroyed with the container via non-first base", "[inheritance][mi]") {
    g_alive = 0;
    {
        capdi::container c;
        c.get_registry().add_singleton<ISwimmable, Duck>();
        REQUIRE(c.resolve<ISwimmable>()->swim_speed() == 5);
        REQUIRE(g_alive == 1);
    }
    REQUIRE(g_alive == 0);
}

TEST_CASE("MI: per_request instance outlives the container", "[inheritance][mi]") {
    g_alive = 0;
    {
        auto ptr = [] {
            capdi::container c;
            c.get_registry().add_per_request<ISwimmable, Duck>();
            return c.resolve<ISwimmable>();
        }();
        REQUIRE(g_alive == 1);
        REQUIRE(ptr->swim_speed() == 5);
    }
    REQUIRE(g_alive == 0);
}

TEST_CASE("MI: scoped instance destroyed on scope exit via non-first base", "[inheritance][mi]") {
    g_alive = 0;
    capdi::container c;
    c.get_registry().add_scoped<ISwimmable, Duck>();
    {
        auto s = c.enter_scope();
        c.resolve<ISwimmable>();
        REQUIRE(g_alive == 1);
    }
    REQUIRE(g_alive == 0);
}

// ===============================================================
// Virtual Inheritance
// ===============================================================

TEST_CASE("VI: simple virtual inheritance chain", "[inheritance][vi]") {
    capdi::container c;
    c.get_registry().add_singleton<VBase, VLeaf>();

    REQUIRE(c.resolve<VBase>()->id() == 42);
}

TEST_CASE("VI: register as intermediate virtual base", "[inheritance][vi]") {
    capdi::container c;
    c.get_registry().add_per_request<VMid, VLeaf>();

    REQUIRE(c.resolve<VMid>()->id() == 42);
}

TEST_CASE("VI: diamond - resolve via each interface", "[inheritance][vi][diamond]") {
    capdi::container c;
    c.get_registry().add_singleton<IShape, DrawableResizableRect>();
    c.get_registry().add_singleton<IDrawable, DrawableResizableRect>();
    c.get_registry().add_singleton<IResizable, DrawableResizableRect>();

    REQUIRE(c.resolve<IShape>()->shape_name() == "rect");
    REQUIRE(c.resolve<IDrawable>()->shape_name() == "rect");
    REQUIRE(c.resolve<IResizable>()->shape_name() == "rect");
}
