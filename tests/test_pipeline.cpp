#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libmedi.hpp>

#include <algorithm>
#include <any>
#include <cctype>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace libmedi;

namespace {

std::vector<std::string>& trail() {
    static std::vector<std::string> events;
    return events;
}

struct Greet : request<std::string> {
    std::string name;
};

struct Count : request<int> {};

struct GreetHandler : request_handler<Greet> {
    static inline int calls = 0;
    result<std::string> handle(const Greet& req, std::stop_token) override {
        ++calls;
        trail().push_back("handler");
        return "hello " + req.name;
    }
};

struct CountHandler : request_handler<Count> {
    result<int> handle(const Count&, std::stop_token) override {
        trail().push_back("count");
        return 7;
    }
};

template <char Tag>
struct Tracing : pipeline_behavior {
    erased_result handle(const request_context&, const next_fn& next) override {
        trail().push_back(std::string(1, Tag) + ":before");
        auto outcome = next();
        trail().push_back(std::string(1, Tag) + ":after");
        return outcome;
    }
};

using TraceA = Tracing<'A'>;
using TraceB = Tracing<'B'>;
using TraceC = Tracing<'C'>;

struct Reject : pipeline_behavior {
    erased_result handle(const request_context& ctx, const next_fn&) override {
        trail().push_back("reject");
        return handler_error{"forbidden", "no access to " + ctx.shape_name()};
    }
};

struct CallsTwice : pipeline_behavior {
    erased_result handle(const request_context&, const next_fn& next) override {
        next();
        return next();
    }
};

struct WrongType : pipeline_behavior {
    erased_result handle(const request_context&, const next_fn&) override {
        return erased_result(std::any(42));
    }
};

struct Shout : typed_behavior<Greet> {
    result<std::string> handle_request(const Greet&, std::stop_token,
                                       const next_delegate& next) override {
        auto r = next();
        if (!r) return r;
        std::string text = r.value();
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    }
};

struct RejectEmptyName : typed_behavior<Greet> {
    result<std::string> handle_request(const Greet& req, std::stop_token,
                                       const next_delegate& next) override {
        if (req.name.empty()) return handler_error{"invalid", "name is required"};
        return next();
    }
};

struct ISuffix {
    virtual ~ISuffix() = default;
    virtual std::string text() const = 0;
};

struct Exclaim : ISuffix {
    std::string text() const override { return "!"; }
};

struct AppendSuffix : pipeline_behavior {
    explicit AppendSuffix(ISuffix& suffix) : suffix_(suffix) {}

    erased_result handle(const request_context& ctx, const next_fn& next) override {
        auto outcome = next();
        if (outcome.ok() && ctx.is<Greet>()) {
            auto* text = std::any_cast<std::string>(&outcome.value());
            if (text) *text += suffix_.text();
        }
        return outcome;
    }

private:
    ISuffix& suffix_;
};

behavior_descriptor describe(std::type_index type, int order, std::size_t sequence,
                             std::vector<std::type_index> shapes = {}) {
    return behavior_descriptor{
        .behavior_type = type,
        .order = order,
        .sequence = sequence,
        .shapes = std::move(shapes),
        .as_behavior = nullptr,
        .registration_location = std::source_location::current(),
    };
}

result<std::string> send_greet(const std::shared_ptr<resolver>& container, std::string name) {
    mediator m(container);
    auto s = container->create_scope();
    Greet req;
    req.name = std::move(name);
    return m.send(*s, req);
}

} // namespace

// ---------------------------------------------------------------
// pipeline_composer
// ---------------------------------------------------------------

TEST_CASE("Composer: lower order runs first, ties keep registration order", "[pipeline]") {
    std::vector<behavior_descriptor> behaviors;
    behaviors.push_back(describe(typeid(TraceA), 20, 0));
    behaviors.push_back(describe(typeid(TraceB), 10, 1));
    behaviors.push_back(describe(typeid(TraceC), 10, 2));
    pipeline_composer composer(std::move(behaviors));

    const auto& chain = composer.compose(typeid(Greet));
    REQUIRE(chain.size() == 3);
    REQUIRE(chain[0]->behavior_type == typeid(TraceB));
    REQUIRE(chain[1]->behavior_type == typeid(TraceC));
    REQUIRE(chain[2]->behavior_type == typeid(TraceA));
}

TEST_CASE("Composer: restricted behaviors only join their shapes", "[pipeline]") {
    std::vector<behavior_descriptor> behaviors;
    behaviors.push_back(describe(typeid(TraceA), 0, 0));
    behaviors.push_back(describe(typeid(TraceB), 0, 1, request_types<Count>()));
    pipeline_composer composer(std::move(behaviors));

    REQUIRE(composer.compose(typeid(Greet)).size() == 1);
    const auto& count_chain = composer.compose(typeid(Count));
    REQUIRE(count_chain.size() == 2);
    REQUIRE(count_chain[1]->behavior_type == typeid(TraceB));
}

TEST_CASE("Composer: chain is computed once per shape", "[pipeline]") {
    std::vector<behavior_descriptor> behaviors;
    behaviors.push_back(describe(typeid(TraceA), 0, 0));
    pipeline_composer composer(std::move(behaviors));
    composer.precompute({typeid(Greet)});

    const auto& first = composer.compose(typeid(Greet));
    const auto& second = composer.compose(typeid(Greet));
    REQUIRE(&first == &second);
}

TEST_CASE("Composer: shape without behaviors has an empty chain", "[pipeline]") {
    pipeline_composer composer;
    REQUIRE(composer.compose(typeid(Greet)).empty());
    REQUIRE(composer.behaviors().empty());
}

// ---------------------------------------------------------------
// Behaviors around dispatch
// ---------------------------------------------------------------

TEST_CASE("Pipeline: behaviors wrap the handler outermost first", "[pipeline]") {
    trail().clear();
    registry reg;
    reg.add_handler<Greet, GreetHandler>();
    reg.add_behavior<TraceA>(behavior_options{.order = 20});
    reg.add_behavior<TraceB>(behavior_options{.order = 10});
    reg.add_behavior<TraceC>(behavior_options{.order = 10});
    auto container = reg.build();

    auto r = send_greet(container, "ada");
    REQUIRE(r.ok());
    REQUIRE(r.value() == "hello ada");
    REQUIRE(trail() == std::vector<std::string>{
        "B:before", "C:before", "A:before", "handler", "A:after", "C:after", "B:after"});
}

TEST_CASE("Pipeline: short-circuit skips the handler", "[pipeline]") {
    trail().clear();
    GreetHandler::calls = 0;
    registry reg;
    reg.add_handler<Greet, GreetHandler>();
    reg.add_behavior<TraceA>(behavior_options{.order = 0});
    reg.add_behavior<Reject>(behavior_options{.order = 1});
    reg.add_behavior<TraceB>(behavior_options{.order = 2});
    auto container = reg.build();

    auto r = send_greet(container, "ada");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().code == "forbidden");
    REQUIRE(GreetHandler::calls == 0);
    REQUIRE(trail() == std::vector<std::string>{"A:before", "reject", "A:after"});
}

TEST_CASE("Pipeline: calling next twice is a pipeline_error", "[pipeline]") {
    trail().clear();
    registry reg;
    reg.add_handler<Greet, GreetHandler>();
    reg.add_behavior<CallsTwice>();
    auto container = reg.build();

    REQUIRE_THROWS_AS(send_greet(container, "ada"), pipeline_error);
    REQUIRE(std::count(trail().begin(), trail().end(), "handler") == 1);
}

TEST_CASE("Pipeline: response of the wrong type is a pipeline_error", "[pipeline]") {
    registry reg;
    reg.add_handler<Greet, GreetHandler>();
    reg.add_behavior<WrongType>();
    auto container = reg.build();

    try {
        send_greet(container, "ada");
        FAIL("Expected pipeline_error");
    } catch (const pipeline_error& e) {
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("expected"));
    }
}

TEST_CASE("Pipeline: registering a behavior again replaces it", "[pipeline]") {
    registry reg;
    reg.add_handler<Greet, GreetHandler>();
    reg.add_behavior<TraceA>(behavior_options{.order = 5});
    reg.add_behavior<TraceB>(behavior_options{.order = 10});
    reg.add_behavior<TraceA>(behavior_options{.order = 50});
    auto container = reg.build();

    const auto& chain = container->pipelines().compose(typeid(Greet));
    REQUIRE(chain.size() == 2);
    REQUIRE(chain[0]->behavior_type == typeid(TraceB));
    REQUIRE(chain[1]->behavior_type == typeid(TraceA));
    REQUIRE(chain[1]->order == 50);
}

TEST_CASE("Pipeline: only restricts a behavior to listed shapes", "[pipeline]") {
    trail().clear();
    registry reg;
    reg.add_handler<Greet, GreetHandler>();
    reg.add_handler<Count, CountHandler>();
    reg.add_behavior<TraceA>(behavior_options{.only = request_types<Count>()});
    auto container = reg.build();

    REQUIRE(send_greet(container, "ada").ok());
    REQUIRE(trail() == std::vector<std::string>{"handler"});

    trail().clear();
    mediator m(container);
    auto s = container->create_scope();
    auto counted = m.send(*s, Count{});
    REQUIRE(counted.value() == 7);
    REQUIRE(trail() == std::vector<std::string>{"A:before", "count", "A:after"});
}

// ---------------------------------------------------------------
// Typed behaviors
// ---------------------------------------------------------------

TEST_CASE("Pipeline: typed behavior applies to its own shape only", "[pipeline]") {
    registry reg;
    reg.add_handler<Greet, GreetHandler>();
    reg.add_handler<Count, CountHandler>();
    reg.add_behavior<Shout>();
    auto container = reg.build();

    REQUIRE(container->pipelines().compose(typeid(Greet)).size() == 1);
    REQUIRE(container->pipelines().compose(typeid(Count)).empty());
    REQUIRE(send_greet(container, "ada").value() == "HELLO ADA");
}

TEST_CASE("Pipeline: typed behavior can short-circuit with a handler_error", "[pipeline]") {
    GreetHandler::calls = 0;
    registry reg;
    reg.add_handler<Greet, GreetHandler>();
    reg.add_behavior<RejectEmptyName>();
    auto container = reg.build();

    auto r = send_greet(container, "");
    REQUIRE_FALSE(r);
    REQUIRE(r.error() == handler_error{"invalid", "name is required"});
    REQUIRE(GreetHandler::calls == 0);
    REQUIRE(send_greet(container, "bob").value() == "hello bob");
}

TEST_CASE("Pipeline: typed behavior restricted to another shape is rejected", "[pipeline]") {
    registry reg;
    REQUIRE_THROWS_AS(reg.add_behavior<Shout>(behavior_options{.only = request_types<Count>()}),
                      configuration_error);
    REQUIRE_NOTHROW(reg.add_behavior<Shout>(behavior_options{.only = request_types<Greet>()}));
}

TEST_CASE("Pipeline: behaviors receive injected dependencies", "[pipeline]") {
    registry reg;
    reg.add_singleton<ISuffix, Exclaim>();
    reg.add_handler<Greet, GreetHandler>();
    reg.add_behavior<AppendSuffix>(deps<ISuffix>, behavior_options{.order = 1});
    reg.add_behavior<Shout>(behavior_options{.order = 0});
    auto container = reg.build();

    // Shout is outermost, so it sees the suffixed response.
    REQUIRE(send_greet(container, "ada").value() == "HELLO ADA!");
}

TEST_CASE("Pipeline: behavior depending on an unregistered component fails the build", "[pipeline]") {
    registry reg;
    reg.add_handler<Greet, GreetHandler>();
    reg.add_behavior<AppendSuffix>(deps<ISuffix>);
    REQUIRE_THROWS_AS(reg.build(), not_found);
}
