/// basic_usage.cpp: libmedi introductory example.
///
/// Demonstrates the registration → build → dispatch workflow:
///   1. Define capabilities, request shapes and their handlers.
///   2. Register them with a lifetime; dependencies declared via deps<>.
///   3. Add pipeline behaviors that wrap every dispatch.
///   4. Call build() to validate the graph, then send requests through a
///      mediator inside a scope per unit of work.

#include <libmedi.hpp>

#include <spdlog/spdlog.h>

#include <iostream>
#include <map>
#include <string>

using namespace libmedi;

// -----------------------------------------------------------------------
// Capabilities
// -----------------------------------------------------------------------

struct i_inventory {
    virtual ~i_inventory() = default;
    virtual int stock(const std::string& sku) const = 0;
    virtual bool reserve(const std::string& sku, int quantity) = 0;
};

struct i_unit_of_work {
    virtual ~i_unit_of_work() = default;
    virtual void record(const std::string& change) = 0;
};

struct memory_inventory : i_inventory {
    int stock(const std::string& sku) const override {
        auto it = items_.find(sku);
        return it == items_.end() ? 0 : it->second;
    }

    bool reserve(const std::string& sku, int quantity) override {
        auto it = items_.find(sku);
        if (it == items_.end() || it->second < quantity) return false;
        it->second -= quantity;
        return true;
    }

private:
    std::map<std::string, int> items_{{"apple", 10}, {"pear", 2}};
};

// Scoped: one per unit of work, flushed when the scope is released.
struct console_unit_of_work : i_unit_of_work, disposable {
    void record(const std::string& change) override { ++changes_; std::cout << "  change: " << change << '\n'; }
    void dispose() override { std::cout << "  unit of work closed (" << changes_ << " change(s))\n"; }

private:
    int changes_ = 0;
};

// -----------------------------------------------------------------------
// Requests and handlers
// -----------------------------------------------------------------------

struct get_stock : request<int> {
    std::string sku;
};

struct reserve_stock : command {
    std::string sku;
    int quantity = 0;
};

struct get_stock_handler : request_handler<get_stock> {
    explicit get_stock_handler(i_inventory& inventory) : inventory_(inventory) {}

    result<int> handle(const get_stock& req, std::stop_token) override {
        return inventory_.stock(req.sku);
    }

private:
    i_inventory& inventory_;
};

struct reserve_stock_handler : request_handler<reserve_stock> {
    reserve_stock_handler(i_inventory& inventory, i_unit_of_work& work)
        : inventory_(inventory), work_(work) {}

    result<unit> handle(const reserve_stock& req, std::stop_token) override {
        if (!inventory_.reserve(req.sku, req.quantity)) {
            return handler_error{"insufficient_stock", "not enough " + req.sku};
        }
        work_.record("reserved " + std::to_string(req.quantity) + " " + req.sku);
        return unit{};
    }

private:
    i_inventory& inventory_;
    i_unit_of_work& work_;
};

// Rejects non-positive quantities before the handler runs.
struct validate_quantity : typed_behavior<reserve_stock> {
    result<unit> handle_request(const reserve_stock& req, std::stop_token,
                                const next_delegate& next) override {
        if (req.quantity <= 0) {
            return handler_error{"invalid_quantity", "quantity must be positive"};
        }
        return next();
    }
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    spdlog::set_level(spdlog::level::info);

    // ── Registration phase ────────────────────────────────────────────
    registry reg;
    reg.add_singleton<i_inventory, memory_inventory>();
    reg.add_scoped<i_unit_of_work, console_unit_of_work>();

    reg.add_handler<get_stock, get_stock_handler>(deps<i_inventory>);
    reg.add_handler<reserve_stock, reserve_stock_handler>(deps<i_inventory, i_unit_of_work>);

    // logging_behavior wraps everything; validation runs inside it.
    reg.add_behavior<logging_behavior>(behavior_options{.order = -10});
    reg.add_behavior<validate_quantity>();

    // ── Build phase (validates handlers and the dependency graph) ─────
    auto container = reg.build();
    mediator m(container);

    // ── Dispatch phase: one scope per unit of work ────────────────────
    {
        auto work = container->create_scope();

        reserve_stock order;
        order.sku = "apple";
        order.quantity = 3;
        auto reserved = m.send(*work, order);
        std::cout << "reserve apple x3: " << (reserved ? "ok" : reserved.error().message) << '\n';

        order.quantity = 0;
        auto rejected = m.send(*work, order);
        std::cout << "reserve apple x0: " << (rejected ? "ok" : rejected.error().message) << '\n';
    }

    {
        auto work = container->create_scope();

        get_stock query;
        query.sku = "apple";
        std::cout << "apple in stock: " << m.send(*work, query).value() << '\n';

        reserve_stock order;
        order.sku = "pear";
        order.quantity = 5;
        auto outcome = m.send(*work, order);
        if (!outcome) {
            std::cout << "reserve pear x5 failed: [" << outcome.error().code << "] "
                      << outcome.error().message << '\n';
        }
    }

    std::cout << "Done.\n";
    return 0;
}
