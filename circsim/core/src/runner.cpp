#include <circsim/core/runner.hpp>
#include <circsim/core/error.hpp>
#include <circsim/core/logging.hpp>

#include <fmt/format.h>

#include <thread>

namespace circsim::core {

void run(Circuit& circuit, std::vector<SupportingTask> tasks) {
    std::vector<std::jthread> threads;
    threads.reserve(tasks.size());
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        threads.emplace_back([&circuit, task = std::move(tasks[i]), i](std::stop_token token) {
            try {
                task(token);
                if (!token.stop_requested()) {
                    logger()->debug("supporting task #{} finished", i);
                    circuit.abort(CancelledError(fmt::format("supporting task #{} finished", i)));
                }
            } catch (const std::exception& e) {
                circuit.abort(SupportingTaskError(fmt::format("supporting task #{} failed: {}", i, e.what())));
            }
        });
    }

    try {
        circuit.run_forever();
    } catch (const CancelledError&) {
        // regular shutdown; the supporting threads are stopped and joined below
    }
}

} // namespace circsim::core
