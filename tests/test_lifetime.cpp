#include <catch2/catch_test_macros.hpp>
#include <libmedi.hpp>

#include <atomic>

namespace {

struct ICounter {
    virtual ~ICounter() = default;
    virtual int next() = 0;
};

struct Counter : ICounter {
    int n = 0;
    int next() override { return ++n; }
};

struct ITracked {
    virtual ~ITracked() = default;
};

struct Tracked : ITracked {
    static inline int alive = 0;
    static inline int constructed = 0;
    Tracked() { ++alive; ++constructed; }
    ~Tracked() override { --alive; }
};

struct IHolder {
    virtual ~IHolder() = default;
    virtual ITracked& held() = 0;
};

struct Holder : IHolder {
    explicit Holder(ITracked& t) : t_(t) {}
    ITracked& held() override { return t_; }
    ITracked& t_;
};

} // namespace

TEST_CASE("singleton returns same instance", "[lifetime]") {
    libmedi::registry reg;
    reg.add_singleton<ICounter, Counter>();
    auto r = reg.build();

    auto& a = r->get<ICounter>();
    auto& b = r->get<ICounter>();
    REQUIRE(&a == &b);
    REQUIRE(a.next() == 1);
    REQUIRE(b.next() == 2); // same instance
}

TEST_CASE("singleton is shared by the container and every scope", "[lifetime]") {
    libmedi::registry reg;
    reg.add_singleton<ICounter, Counter>();
    auto r = reg.build();

    auto s1 = r->create_scope();
    auto s2 = r->create_scope();
    auto* from_root = &r->get<ICounter>();
    REQUIRE(&s1->get<ICounter>() == from_root);
    REQUIRE(&s2->get<ICounter>() == from_root);
}

TEST_CASE("singleton survives the scope that first resolved it", "[lifetime]") {
    Tracked::alive = 0;
    libmedi::registry reg;
    reg.add_singleton<ITracked, Tracked>();
    auto r = reg.build();

    ITracked* first = nullptr;
    {
        auto s = r->create_scope();
        first = &s->get<ITracked>();
    }
    REQUIRE(Tracked::alive == 1);
    REQUIRE(&r->get<ITracked>() == first);
}

TEST_CASE("singleton is created lazily", "[lifetime]") {
    Tracked::constructed = 0;
    libmedi::registry reg;
    reg.add_singleton<ITracked, Tracked>();
    auto r = reg.build();
    REQUIRE(Tracked::constructed == 0);

    r->get<ITracked>();
    r->get<ITracked>();
    REQUIRE(Tracked::constructed == 1);
}

TEST_CASE("scoped is shared within a scope and distinct across scopes", "[lifetime]") {
    libmedi::registry reg;
    reg.add_scoped<ICounter, Counter>();
    auto r = reg.build();

    auto s1 = r->create_scope();
    auto s2 = r->create_scope();
    auto& a1 = s1->get<ICounter>();
    auto& a2 = s1->get<ICounter>();
    auto& b = s2->get<ICounter>();
    REQUIRE(&a1 == &a2);
    REQUIRE(&a1 != &b);
    REQUIRE(a1.next() == 1);
    REQUIRE(b.next() == 1);
}

TEST_CASE("scoped capability cannot be resolved from the container", "[lifetime]") {
    libmedi::registry reg;
    reg.add_scoped<ICounter, Counter>();
    auto r = reg.build();

    REQUIRE_THROWS_AS(r->get<ICounter>(), libmedi::no_active_scope);
    REQUIRE_THROWS_AS(r->try_get<ICounter>(), libmedi::no_active_scope);
}

TEST_CASE("transient returns new instance each time", "[lifetime]") {
    libmedi::registry reg;
    reg.add_transient<ICounter, Counter>();
    auto r = reg.build();

    auto s = r->create_scope();
    auto& a = s->get<ICounter>();
    auto& b = s->get<ICounter>();
    REQUIRE(&a != &b);
    REQUIRE(a.next() == 1);
    REQUIRE(b.next() == 1); // independent instances
}

TEST_CASE("transient resolved from the container is owned by the container", "[lifetime]") {
    Tracked::alive = 0;
    {
        libmedi::registry reg;
        reg.add_transient<ITracked, Tracked>();
        auto r = reg.build();

        r->get<ITracked>();
        r->get<ITracked>();
        REQUIRE(Tracked::alive == 2);
    }
    REQUIRE(Tracked::alive == 0);
}

TEST_CASE("transient dependency of a singleton lives as long as the singleton", "[lifetime]") {
    Tracked::alive = 0;
    libmedi::registry reg;
    reg.add_transient<ITracked, Tracked>();
    reg.add_singleton<IHolder, Holder>(libmedi::deps<ITracked>);
    auto r = reg.build();

    ITracked* held = nullptr;
    {
        auto s = r->create_scope();
        held = &s->get<IHolder>().held();
    }
    // Built against the container, not the scope that asked for it.
    REQUIRE(Tracked::alive == 1);
    REQUIRE(&r->get<IHolder>().held() == held);
}

TEST_CASE("scoped dependency is the instance of the resolving scope", "[lifetime]") {
    libmedi::registry reg;
    reg.add_scoped<ITracked, Tracked>();
    reg.add_transient<IHolder, Holder>(libmedi::deps<ITracked>);
    auto r = reg.build();

    auto s1 = r->create_scope();
    auto s2 = r->create_scope();
    REQUIRE(&s1->get<IHolder>().held() == &s1->get<ITracked>());
    REQUIRE(&s2->get<IHolder>().held() == &s2->get<ITracked>());
    REQUIRE(&s1->get<ITracked>() != &s2->get<ITracked>());
}

TEST_CASE("lifetime_kind names", "[lifetime]") {
    REQUIRE(libmedi::to_string(libmedi::lifetime_kind::singleton) == "singleton");
    REQUIRE(libmedi::to_string(libmedi::lifetime_kind::scoped) == "scoped");
    REQUIRE(libmedi::to_string(libmedi::lifetime_kind::transient) == "transient");
}
