#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libmedi.hpp>

#include <memory>
#include <stdexcept>
#include <string>

namespace {

struct IService {
    virtual ~IService() = default;
    virtual int value() const = 0;
};

struct ServiceA : IService {
    int value() const override { return 1; }
};

struct IClock {
    virtual ~IClock() = default;
    virtual long now() const = 0;
};

struct FixedClock : IClock {
    explicit FixedClock(long t) : t_(t) {}
    long now() const override { return t_; }
    long t_;
};

struct IStamp {
    virtual ~IStamp() = default;
    virtual std::string stamp() const = 0;
};

struct Stamp : IStamp {
    Stamp(IClock& clock, IService& svc) : clock_(clock), svc_(svc) {}
    std::string stamp() const override {
        return std::to_string(clock_.now()) + "/" + std::to_string(svc_.value());
    }
    IClock& clock_;
    IService& svc_;
};

} // namespace

TEST_CASE("get singleton", "[resolution]") {
    libmedi::registry reg;
    reg.add_singleton<IService, ServiceA>();
    auto r = reg.build();

    auto& svc = r->get<IService>();
    REQUIRE(svc.value() == 1);
}

TEST_CASE("try_get returns pointer on success", "[resolution]") {
    libmedi::registry reg;
    reg.add_singleton<IService, ServiceA>();
    auto r = reg.build();

    auto* svc = r->try_get<IService>();
    REQUIRE(svc != nullptr);
    REQUIRE(svc->value() == 1);
}

TEST_CASE("try_get returns nullptr on not registered", "[resolution]") {
    libmedi::registry reg;
    auto r = reg.build();

    REQUIRE(r->try_get<IService>() == nullptr);
}

TEST_CASE("get throws not_found when not registered", "[resolution]") {
    libmedi::registry reg;
    auto r = reg.build();

    REQUIRE_THROWS_AS(r->get<IService>(), libmedi::not_found);
    auto s = r->create_scope();
    REQUIRE_THROWS_AS(s->get<IService>(), libmedi::not_found);
}

TEST_CASE("get_by_type returns the erased interface pointer", "[resolution]") {
    libmedi::registry reg;
    reg.add_singleton<IService, ServiceA>();
    auto r = reg.build();

    void* p = r->get_by_type(typeid(IService));
    REQUIRE(p == &r->get<IService>());
    REQUIRE_THROWS_AS(r->get_by_type(typeid(IClock)), libmedi::not_found);
}

TEST_CASE("dependencies are injected by reference", "[resolution]") {
    libmedi::registry reg;
    reg.add_singleton<IService, ServiceA>();
    reg.add_singleton<IClock>([](libmedi::resolver&) {
        return std::make_unique<FixedClock>(42);
    });
    reg.add_transient<IStamp, Stamp>(libmedi::deps<IClock, IService>);
    auto r = reg.build();

    auto s = r->create_scope();
    auto& stamp = s->get<IStamp>();
    REQUIRE(stamp.stamp() == "42/1");
    REQUIRE(&static_cast<Stamp&>(stamp).svc_ == &r->get<IService>());
}

TEST_CASE("factory registration with declared deps", "[resolution]") {
    libmedi::registry reg;
    reg.add_singleton<IService, ServiceA>();
    reg.add_scoped<IClock>(libmedi::deps<IService>, [](libmedi::resolver& r) {
        return std::make_unique<FixedClock>(100 + r.get<IService>().value());
    });
    auto r = reg.build();

    auto s = r->create_scope();
    REQUIRE(s->get<IClock>().now() == 101);
    REQUIRE(&s->get<IClock>() == &s->get<IClock>());
}

TEST_CASE("factory returning null is a resolution error", "[resolution]") {
    libmedi::registry reg;
    reg.add_transient<IClock>([](libmedi::resolver&) {
        return std::unique_ptr<IClock>();
    });
    auto r = reg.build();

    REQUIRE_THROWS_AS(r->get<IClock>(), libmedi::resolution_error);
}

// ---------------------------------------------------------------
// construction_error wraps factory exceptions
// ---------------------------------------------------------------

TEST_CASE("construction_error wraps factory exception", "[resolution]") {
    struct IFailing {
        virtual ~IFailing() = default;
    };
    struct FailingImpl : IFailing {
        FailingImpl() { throw std::runtime_error("factory boom"); }
    };

    libmedi::registry reg;
    reg.add_singleton<IFailing, FailingImpl>();
    auto r = reg.build();

    try {
        r->get<IFailing>();
        FAIL("Expected construction_error");
    } catch (const libmedi::construction_error& e) {
        std::string msg = e.what();
        REQUIRE(e.component_type() == typeid(IFailing));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("factory boom"));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("IFailing"));
    }
}

TEST_CASE("failed singleton construction is retried on the next resolution", "[resolution]") {
    struct IFlaky { virtual ~IFlaky() = default; };
    static int attempts = 0;
    struct Flaky : IFlaky {
        Flaky() {
            if (++attempts == 1) throw std::runtime_error("first attempt fails");
        }
    };

    attempts = 0;
    libmedi::registry reg;
    reg.add_singleton<IFlaky, Flaky>();
    auto r = reg.build();

    REQUIRE_THROWS_AS(r->get<IFlaky>(), libmedi::construction_error);
    REQUIRE_NOTHROW(r->get<IFlaky>());
    REQUIRE(attempts == 2);
}

TEST_CASE("libmedi errors from nested resolution are not wrapped", "[resolution]") {
    struct IDep {
        virtual ~IDep() = default;
    };
    struct ISvc {
        virtual ~ISvc() = default;
    };
    struct Svc : ISvc {
        explicit Svc(IDep& /*dep*/) {}
    };

    libmedi::registry reg;
    // ISvc depends on IDep which is not registered
    reg.add_singleton<ISvc, Svc>(libmedi::deps<IDep>);
    auto r = reg.build({.validate_on_build = false});

    try {
        r->get<ISvc>();
        FAIL("Expected not_found");
    } catch (const libmedi::not_found& e) {
        std::string msg = e.what();
        REQUIRE(e.component_type() == typeid(IDep));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("while resolving"));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("ISvc"));
    }
}

TEST_CASE("nested construction failure reports the resolution chain", "[resolution]") {
    struct IInner { virtual ~IInner() = default; };
    struct Inner : IInner {
        Inner() { throw std::runtime_error("disk full"); }
    };
    struct IOuter { virtual ~IOuter() = default; };
    struct Outer : IOuter {
        explicit Outer(IInner&) {}
    };

    libmedi::registry reg;
    reg.add_scoped<IInner, Inner>();
    reg.add_scoped<IOuter, Outer>(libmedi::deps<IInner>);
    auto r = reg.build();

    auto s = r->create_scope();
    try {
        s->get<IOuter>();
        FAIL("Expected construction_error");
    } catch (const libmedi::construction_error& e) {
        std::string msg = e.what();
        REQUIRE(e.component_type() == typeid(IInner));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("disk full"));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("IOuter"));
    }
}

TEST_CASE("undeclared cycle through factories is detected at resolution", "[resolution]") {
    struct IPing { virtual ~IPing() = default; };
    struct IPong { virtual ~IPong() = default; };
    struct Ping : IPing {};
    struct Pong : IPong {};

    libmedi::registry reg;
    reg.add_singleton<IPing>([](libmedi::resolver& r) {
        r.get<IPong>();
        return std::make_unique<Ping>();
    });
    reg.add_singleton<IPong>([](libmedi::resolver& r) {
        r.get<IPing>();
        return std::make_unique<Pong>();
    });
    auto r = reg.build();

    try {
        r->get<IPing>();
        FAIL("Expected cyclic_dependency");
    } catch (const libmedi::cyclic_dependency& e) {
        REQUIRE(e.cycle().size() == 3);
        REQUIRE(e.cycle().front() == typeid(IPing));
        REQUIRE(e.cycle().back() == typeid(IPing));
    }
}
