// Example 01: Failover Demo
//
// Routes embedding requests across three simulated providers. The preferred
// one starts failing after a few calls, its circuit opens and traffic moves
// to the next-best provider.

#include <semroute/engine/routing_engine.hpp>
#include <semroute/log/spdlog_logger.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

using namespace semroute;
using namespace std::chrono_literals;

// Answers after a fixed latency; fails every call once `healthy_calls` are used up
class SimulatedBackend final : public IBackendClient {
public:
    SimulatedBackend(std::string name, std::chrono::milliseconds latency, int healthy_calls)
        : name_(std::move(name))
        , latency_(latency)
        , healthy_calls_(healthy_calls)
    {}

    asio::awaitable<BackendResult<BackendResponse>> async_call(BackendRequest request) override {
        asio::steady_timer timer(co_await asio::this_coro::executor, latency_);
        co_await timer.async_wait(asio::use_awaitable);

        if (healthy_calls_ >= 0 && calls_++ >= healthy_calls_) {
            co_return tl::unexpected(BackendError::connection(name_ + ": upstream unavailable"));
        }
        const auto texts = request.payload.value("texts", Json::array()).size();
        co_return BackendResponse{Json{{"provider", name_}, {"vectors", texts}}, texts * 8};
    }

    asio::awaitable<BackendResult<void>> async_probe() override {
        asio::steady_timer timer(co_await asio::this_coro::executor, latency_ / 2);
        co_await timer.async_wait(asio::use_awaitable);
        co_return BackendResult<void>{};
    }

private:
    std::string name_;
    std::chrono::milliseconds latency_;
    int healthy_calls_;  // negative: never fails
    std::atomic<int> calls_{0};
};

int main() {
    std::cout << "=== Failover Demo ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 1. Configure the engine
    auto config = EngineConfig{}
        .with_probe_interval(200ms, 100ms)
        .with_cooldown(500ms, 4s)
        .with_max_attempts(3)
        .with_attempt_timeout(150ms)
        .with_request_deadline(1s);
    config.circuit.open_threshold = 2;

    asio::io_context io;
    RoutingEngine engine(io.get_executor(), config, std::make_shared<LogRoutingObserver>());

    // 2. Register providers
    const ProviderDescriptor providers[] = {
        {.id = {Capability::Embedding, "premium"}, .quality = 0.95, .cost_per_unit = 0.0004, .cost_unit = "token"},
        {.id = {Capability::Embedding, "standard"}, .quality = 0.80, .cost_per_unit = 0.0001, .cost_unit = "token"},
        {.id = {Capability::Embedding, "local"}, .quality = 0.60, .cost_unit = "token"},
    };
    const int healthy_calls[] = {3, -1, -1};
    const std::chrono::milliseconds latencies[] = {20ms, 40ms, 80ms};

    for (std::size_t i = 0; i < std::size(providers); ++i) {
        auto backend = std::make_shared<SimulatedBackend>(providers[i].id.name, latencies[i], healthy_calls[i]);
        if (auto added = engine.register_provider(providers[i], backend); !added) {
            std::cerr << "Registration failed: " << added.error().message << "\n";
            return 1;
        }
    }

    // 3. Watch the preferred provider's circuit
    engine.state_store().state_for(providers[0])->circuit.on_state_change(
        [](CircuitState old_state, CircuitState new_state) {
            std::cout << "\n*** premium circuit: " << to_string(old_state)
                      << " -> " << to_string(new_state) << " ***\n\n";
        });

    engine.start();

    // 4. Send requests
    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        for (int i = 0; i < 10; ++i) {
            BackendRequest request{"embed_batch", Json{{"texts", Json::array({"hello", "world"})}}};
            auto result = co_await engine.execute(Capability::Embedding, std::move(request));

            if (result) {
                std::cout << "Request " << (i + 1) << ": " << result->provider.name
                          << " after " << result->attempts.size() << " attempt(s), cost "
                          << result->cost << "\n";
            } else {
                std::cout << "Request " << (i + 1) << ": FAILED - " << result.error().describe() << "\n";
            }

            asio::steady_timer pause(co_await asio::this_coro::executor, 100ms);
            co_await pause.async_wait(asio::use_awaitable);
        }

        // 5. Final status
        std::cout << "\n=== Engine Status ===\n" << engine.status().to_json().dump(2) << "\n";
        engine.stop();
    }, asio::detached);

    io.run();

    std::cout << "Done!\n";
    return 0;
}
