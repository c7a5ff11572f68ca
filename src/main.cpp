#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "config/MonitorConfig.hpp"
#include "runtime/Monitor.hpp"
#include "storage/EventStore.hpp"

using namespace latmon;

// ---------------------------------------------------------------------------
// Signal handling: the handlers only bump atomics. The main thread turns
// them into Monitor::stop() calls.
//   SIGINT / SIGTERM   first one = graceful, second one = forced
//   SIGQUIT            forced
// ---------------------------------------------------------------------------
static std::atomic<int>  g_stop_signals{0};
static std::atomic<bool> g_force{false};

static void handle_stop(int) {
    g_stop_signals.fetch_add(1, std::memory_order_relaxed);
}

static void handle_quit(int) {
    g_force.store(true, std::memory_order_relaxed);
}

int main() {
    // ./.env first, then ../.env for runs from build/.
    load_dotenv(".env");
    load_dotenv("../.env");

    MonitorConfig cfg;
    try {
        cfg = MonitorConfig::from_environment();
        cfg.validate();
    } catch (const ConfigError& e) {
        std::cerr << "[FATAL] Configuration: " << e.what() << "\n";
        return 1;
    }
    cfg.print();

    Monitor monitor(cfg);
    try {
        monitor.open();
    } catch (const StoreError& e) {
        std::cerr << "[FATAL] Storage: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] Startup: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT,  handle_stop);
    std::signal(SIGTERM, handle_stop);
    std::signal(SIGQUIT, handle_quit);

    monitor.start();

    auto last_print = std::chrono::steady_clock::now();
    constexpr int PRINT_INTERVAL_S = 30;

    while (g_stop_signals.load() == 0 && !g_force.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (now - last_print >= std::chrono::seconds(PRINT_INTERVAL_S)) {
            last_print = now;
            auto* bus = monitor.bus().get();
            auto  st  = monitor.sink()->stats();
            std::cout << "[LATMON] published=" << bus->published()
                      << " dropped=" << bus->dropped()
                      << " stored=" << st.stored
                      << " write_drops=" << st.dropped << "\n";
        }
    }

    if (g_force.load()) {
        monitor.stop(ShutdownMode::FORCED);
    } else {
        // Drain on a helper thread so a second signal can still escalate.
        std::thread stopper([&monitor]() { monitor.stop(ShutdownMode::GRACEFUL); });
        bool escalated = false;
        while (monitor.sink()->running() || monitor.aggregator()->running() ||
               !monitor.active_samplers().empty()) {
            if (!escalated && (g_stop_signals.load() > 1 || g_force.load())) {
                std::cout << "[LATMON] Second signal, forcing shutdown\n";
                monitor.stop(ShutdownMode::FORCED);
                escalated = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        stopper.join();
    }

    monitor.print_summary();
    std::cout << "[LATMON] Clean exit\n";
    return 0;
}
