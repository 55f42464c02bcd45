#include <catch2/catch_test_macros.hpp>
#include <capdi.hpp>

#include <memory>
#include <stdexcept>
#include <string>

namespace {

struct IFoo {
    virtual ~IFoo() = default;
    virtual int id() const = 0;
};

struct FooA : IFoo {
    int id() const override { return 1; }
};

struct FooB : IFoo {
    int id() const override { return 2; }
};

struct ICounted {
    virtual ~ICounted() = default;
};

struct Counted : ICounted {
    static int constructed;
    Counted() { ++constructed; }
};
int Counted::constructed = 0;

} // namespace

TEST_CASE("empty container", "[edge_cases]") {
    capdi::container c;
    REQUIRE(c.get_registry().empty());
    REQUIRE(c.options().detect_cycles);
    REQUIRE_FALSE(c.options().log_cache_hits);
    REQUIRE(c.try_resolve<IFoo>() == nullptr);
}

TEST_CASE("self-registration (interface == impl)", "[edge_cases]") {
    struct Concrete {
        int val = 7;
    };

    capdi::container c;
    c.get_registry().add_singleton<Concrete, Concrete>();
    REQUIRE(c.resolve<Concrete>()->val == 7);
}

TEST_CASE("large registration count", "[edge_cases]") {
    // Each registration needs a distinct capability type
    struct I0 { virtual ~I0() = default; };
    struct I1 { virtual ~I1() = default; };
    struct I2 { virtual ~I2() = default; };
    struct I3 { virtual ~I3() = default; };
    struct I4 { virtual ~I4() = default; };
    struct C0 : I0 {};
    struct C1 : I1 {};
    struct C2 : I2 {};
    struct C3 : I3 {};
    struct C4 : I4 {};

    capdi::container c;
    c.get_registry()
        .add_singleton<I0, C0>()
        .add_per_request<I1, C1>()
        .add_scoped<I2, C2>()
        .add_singleton<I3, C3>()
        .add_per_request<I4, C4>();

    REQUIRE(c.get_registry().size() == 5);
    auto s = c.enter_scope();
    REQUIRE(c.resolve<I0>() != nullptr);
    REQUIRE(c.resolve<I1>() != nullptr);
    REQUIRE(c.resolve<I2>() != nullptr);
    REQUIRE(c.resolve<I3>() != nullptr);
    REQUIRE(c.resolve<I4>() != nullptr);
}

TEST_CASE("re-registration does not evict a cached singleton", "[edge_cases]") {
    capdi::container c;
    c.get_registry().add_singleton<IFoo, FooA>();
    auto first = c.resolve<IFoo>();

    c.get_registry().add_singleton<IFoo, FooB>();
    REQUIRE(c.resolve<IFoo>().get() == first.get());
    REQUIRE(c.resolve<IFoo>()->id() == 1);
}

TEST_CASE("re-registration applies to uncached lifetimes immediately", "[edge_cases]") {
    capdi::container c;
    c.get_registry().add_per_request<IFoo, FooA>();
    REQUIRE(c.resolve<IFoo>()->id() == 1);

    c.get_registry().add_per_request<IFoo, FooB>();
    REQUIRE(c.resolve<IFoo>()->id() == 2);
}

TEST_CASE("re-registration takes effect in the next scope", "[edge_cases]") {
    capdi::container c;
    c.get_registry().add_scoped<IFoo, FooA>();

    auto s1 = c.enter_scope();
    REQUIRE(c.resolve<IFoo>()->id() == 1);
    c.get_registry().add_scoped<IFoo, FooB>();
    REQUIRE(c.resolve<IFoo>()->id() == 1);
    s1.exit();

    auto s2 = c.enter_scope();
    REQUIRE(c.resolve<IFoo>()->id() == 2);
}

TEST_CASE("producer may replace its own registration", "[edge_cases]") {
    capdi::container c;
    c.get_registry().add_factory<IFoo>([](capdi::container& owner) {
        owner.get_registry().add_per_request<IFoo, FooB>();
        return std::make_shared<FooA>();
    });

    REQUIRE(c.resolve<IFoo>()->id() == 1);
    REQUIRE(c.resolve<IFoo>()->id() == 2);
}

TEST_CASE("producer may enter its own scope", "[edge_cases]") {
    struct IUnit {
        virtual ~IUnit() = default;
    };
    struct Unit : IUnit {};

    capdi::container c;
    c.get_registry().add_per_request<IUnit, Unit>();
    c.get_registry().add_factory<IFoo>([](capdi::container& owner) {
        auto inner = owner.enter_scope();
        owner.resolve<IUnit>();
        return std::make_shared<FooA>();
    }, capdi::lifetime_kind::scoped);

    auto s = c.enter_scope();
    auto first = c.resolve<IFoo>();
    REQUIRE(c.scope_depth() == 1);
    REQUIRE(c.resolve<IFoo>().get() == first.get());
}

TEST_CASE("failed resolve discards the instances it cached", "[edge_cases]") {
    struct Broken : IFoo {
        Broken(std::shared_ptr<ICounted>, int) { throw std::runtime_error("broken"); }
        int id() const override { return 0; }
    };

    Counted::constructed = 0;
    capdi::container c;
    c.get_registry().add_singleton<ICounted, Counted>();
    c.get_registry().add_singleton<IFoo, Broken>(
        capdi::params(capdi::dep<ICounted>(), capdi::arg<int>("n", 1)));

    REQUIRE_THROWS_AS(c.resolve<IFoo>(), capdi::construction_failed);
    REQUIRE(Counted::constructed == 1);

    // The singleton built for the failed resolve was not kept.
    auto dep = c.resolve<ICounted>();
    REQUIRE(Counted::constructed == 2);

    // One cached before the failure survives it.
    REQUIRE_THROWS_AS(c.resolve<IFoo>(), capdi::construction_failed);
    REQUIRE(c.resolve<ICounted>().get() == dep.get());
    REQUIRE(Counted::constructed == 2);
}

TEST_CASE("failed resolve discards scoped instances it cached", "[edge_cases]") {
    capdi::container c;
    c.get_registry().add_scoped<ICounted, Counted>();

    std::weak_ptr<ICounted> seen;
    c.get_registry().add_factory<IFoo>([&seen](capdi::container& owner) -> std::shared_ptr<IFoo> {
        seen = owner.resolve<ICounted>();
        throw std::runtime_error("broken");
    });

    auto s = c.enter_scope();
    REQUIRE_THROWS_AS(c.resolve<IFoo>(), capdi::construction_failed);
    REQUIRE(seen.expired());
}

TEST_CASE("producer recovering from a nested failure keeps its dependencies", "[edge_cases]") {
    capdi::container c;
    c.get_registry().add_singleton<ICounted, Counted>();
    std::shared_ptr<ICounted> seen;
    c.get_registry().add_factory<IFoo>([&seen](capdi::container& owner) {
        seen = owner.resolve<ICounted>();
        try {
            owner.resolve<IFoo>();
        } catch (const capdi::cyclic_dependency&) {
        }
        return std::make_shared<FooA>();
    });

    REQUIRE(c.resolve<IFoo>()->id() == 1);
    REQUIRE(c.resolve<ICounted>().get() == seen.get());
}

TEST_CASE("cycle through a singleton is detected at resolve time", "[edge_cases]") {
    struct IX { virtual ~IX() = default; };
    struct IY { virtual ~IY() = default; };
    struct X : IX { explicit X(std::shared_ptr<IY>) {} };
    struct Y : IY { explicit Y(std::shared_ptr<IX>) {} };

    capdi::container c;
    c.get_registry().add_singleton<IX, X>(capdi::deps<IY>);
    c.get_registry().add_per_request<IY, Y>(capdi::deps<IX>);

    REQUIRE_THROWS_AS(c.resolve<IX>(), capdi::cyclic_dependency);
    REQUIRE_THROWS_AS(c.resolve<IY>(), capdi::cyclic_dependency);
}

TEST_CASE("self-dependency is a cycle", "[edge_cases]") {
    struct ISelf { virtual ~ISelf() = default; };
    struct Self : ISelf { explicit Self(std::shared_ptr<ISelf>) {} };

    capdi::container c;
    c.get_registry().add_per_request<ISelf, Self>(capdi::deps<ISelf>);

    try {
        c.resolve<ISelf>();
        FAIL("Expected cyclic_dependency");
    } catch (const capdi::cyclic_dependency& e) {
        REQUIRE(e.cycle().size() == 2);
    }
}

TEST_CASE("resolving the same capability twice in one graph is not a cycle", "[edge_cases]") {
    struct IDep { virtual ~IDep() = default; };
    struct Dep : IDep {};
    struct Pair : IFoo {
        Pair(std::shared_ptr<IDep> a, std::shared_ptr<IDep> b) : same(a == b) {}
        bool same;
        int id() const override { return same ? 1 : 0; }
    };

    capdi::container c;
    c.get_registry().add_per_request<IDep, Dep>();
    c.get_registry().add_per_request<IFoo, Pair>(capdi::deps<IDep, IDep>);

    REQUIRE(c.resolve<IFoo>()->id() == 0);
}

TEST_CASE("separate containers do not share instances", "[edge_cases]") {
    capdi::container c1;
    capdi::container c2;
    c1.get_registry().add_singleton<IFoo, FooA>();
    c2.get_registry().add_singleton<IFoo, FooA>();

    REQUIRE(c1.resolve<IFoo>().get() != c2.resolve<IFoo>().get());
}

TEST_CASE("scope of one container does not activate another", "[edge_cases]") {
    capdi::container c1;
    capdi::container c2;
    c2.get_registry().add_scoped<IFoo, FooA>();

    auto s = c1.enter_scope();
    REQUIRE_THROWS_AS(c2.resolve<IFoo>(), capdi::no_active_scope);
}
