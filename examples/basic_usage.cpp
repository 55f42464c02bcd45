/// basic_usage.cpp — capdi introductory example.
///
/// Demonstrates the core register → resolve workflow:
///   1. Define interfaces and implementations (no framework base classes).
///   2. Register each capability with a lifetime and its constructor
///      parameters, declared via deps<> or params(dep<>, arg<>).
///   3. Optionally validate() the declared graph.
///   4. Resolve capabilities by interface; enter scopes for scoped ones.

#include <capdi.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace capdi;

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_config {
    virtual ~i_config() = default;
    virtual std::string greeting() const = 0;
};

struct i_request_context {
    virtual ~i_request_context() = default;
    virtual std::string request_id() const = 0;
};

struct i_greeter {
    virtual ~i_greeter() = default;
    virtual std::string greet(const std::string& name) const = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct static_config : i_config {
    explicit static_config(std::string greeting) : greeting_(std::move(greeting)) {}

    std::string greeting() const override { return greeting_; }

private:
    std::string greeting_;
};

struct request_context : i_request_context {
    inline static int counter = 0;
    int id_;

    explicit request_context(std::shared_ptr<i_config>) : id_(++counter) {}

    std::string request_id() const override {
        return "req-" + std::to_string(id_);
    }
};

struct greeter : i_greeter {
    explicit greeter(std::shared_ptr<i_request_context> ctx)
        : ctx_(std::move(ctx)) {}

    std::string greet(const std::string& name) const override {
        return "Hello, " + name + "! (" + ctx_->request_id() + ")";
    }

private:
    std::shared_ptr<i_request_context> ctx_;
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    auto log = std::make_shared<spdlog::logger>(
        "capdi", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    log->set_level(spdlog::level::debug);
    set_logger(log);

    container c;
    auto& reg = c.get_registry();

    // static_config: singleton, its constructor argument fixed at registration.
    reg.add_singleton<i_config, static_config>(
        params(arg<std::string>("greeting")), {{"greeting", "Welcome"}});

    // request_context: scoped — one instance per scope (e.g. per request).
    reg.add_scoped<i_request_context, request_context>(deps<i_config>);

    // greeter: per_request — a fresh instance for every resolve.
    reg.add_per_request<i_greeter, greeter>(deps<i_request_context>);

    try {
        reg.validate({.check_missing = true, .detect_cycles = true, .validate_lifetimes = true});
    } catch (const di_error& e) {
        std::cerr << e.full_diagnostic() << '\n';
        return 1;
    }

    std::cout << c.resolve<i_config>()->greeting() << '\n';

    {
        auto request1 = c.enter_scope();
        const auto g1 = c.resolve<i_greeter>();
        const auto g2 = c.resolve<i_greeter>();

        // Per-request → distinct greeters, sharing the scope's context.
        assert(g1.get() != g2.get());
        std::cout << g1->greet("World") << '\n';
        std::cout << g2->greet("again") << '\n';
    }

    {
        auto request2 = c.enter_scope();
        std::cout << c.resolve<i_greeter>()->greet("World") << '\n';
    }
    // Scopes released here; all scoped instances destroyed.

    try {
        c.resolve<i_greeter>();
    } catch (const no_active_scope& e) {
        std::cout << "Outside a scope: " << e.what() << '\n';
    }

    std::cout << "Done.\n";
    return 0;
}
