#pragma once

#include <circsim/core/block.hpp>
#include <circsim/core/cblock.hpp>
#include <circsim/core/const_pool.hpp>
#include <circsim/core/logging.hpp>
#include <circsim/core/persistence.hpp>
#include <circsim/core/sblock.hpp>
#include <circsim/core/timer.hpp>
#include <circsim/core/trace_writer.hpp>
#include <circsim/core/types.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace circsim::core {

/// @brief Lifecycle state of a circuit.
enum class CircuitState {
    Building,      ///< blocks may be added and connected
    Finalized,     ///< connections resolved, not started
    Starting,      ///< blocks are being started
    Initializing,  ///< sequential blocks are being initialized
    Running,       ///< the simulation loop is running
    Stopping,      ///< blocks are being stopped
    Terminated,    ///< finished; cannot be restarted
};

[[nodiscard]] std::string_view to_string(CircuitState state) noexcept;

/// @brief A circuit: block registry, simulation kernel and lifecycle.
///
/// The circuit owns its blocks and constants. All block state, the timer
/// queue and the propagation queues are touched only from the simulation
/// thread, i.e. the thread running run_forever() or driving the manual
/// mode. Other threads communicate with the circuit through post(),
/// submit(), send_event(), abort() and shutdown().
///
/// @code
/// core::Circuit circuit;
/// auto& in = circuit.add<blocks::Input>(core::BlockOptions{.name = "in"},
///                                       blocks::Input::Config{.initdef = false});
/// circuit.add<core::Not>(core::BlockOptions{.name = "inv"}).connect({in});
/// std::jthread sim([&] { circuit.run_forever(); });
/// circuit.wait_init();
/// circuit.send_event("in", "put", {{"value", true}}).get();
/// circuit.shutdown();
/// @endcode
///
/// The manual mode (initialize(), settle(), run_until()) drives the
/// kernel from the calling thread, typically with virtual time in tests.
///
/// @see Block, Options
/// @ingroup core_circuit
class Circuit {
public:
    /// @brief Circuit-wide settings.
    struct Options {
        /// Evaluation limit per block and propagation burst.
        std::size_t max_evals_per_block{3};
        /// Use a virtual clock advanced only by due timers.
        bool virtual_time{false};
        /// Initial virtual time; defaults to the system time.
        std::optional<TimePoint> start_time;
    };

    Circuit();
    explicit Circuit(Options options);
    ~Circuit();

    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;
    Circuit(Circuit&&) = delete;
    Circuit& operator=(Circuit&&) = delete;

    // ------------------------------------------------------------ registry

    /// @brief Create and register a block.
    ///
    /// The block is constructed as `T(circuit, args...)`.
    ///
    /// @throws AlreadyFinalizedError after finalize().
    /// @throws ConfigurationError for an invalid, reserved or duplicate name.
    template<typename T, typename... Args>
    T& add(Args&&... args) {
        static_assert(std::is_base_of_v<Block, T>, "T must be a Block");
        check_not_finalized();
        auto block = std::make_unique<T>(*this, std::forward<Args>(args)...);
        T& ref = *block;
        register_block(std::move(block), false);
        return ref;
    }

    /// @brief Block by name, nullptr if not found.
    [[nodiscard]] Block* find_block(std::string_view name) const noexcept;

    /// @brief Block by name.
    /// @throws ConfigurationError if not found.
    [[nodiscard]] Block& block(std::string_view name) const;

    /// @brief Block by name, creating `_ctrl` and `_not_<name>` on demand.
    /// @throws ConfigurationError if not found and not creatable.
    Block& resolve_name(std::string_view name);

    [[nodiscard]] const std::vector<std::unique_ptr<Block>>& blocks() const noexcept { return blocks_; }

    template<typename T>
    [[nodiscard]] std::vector<T*> blocks_of() const {
        std::vector<T*> result;
        for (const auto& blk : blocks_) {
            if (auto* typed = dynamic_cast<T*>(blk.get())) {
                result.push_back(typed);
            }
        }
        return result;
    }

    /// @brief Interned constant owned by this circuit.
    const Const& make_const(const Value& value) { return consts_.get(value); }

    [[nodiscard]] const ConstPool& const_pool() const noexcept { return consts_; }

    /// @brief Resolve all connections and event destinations.
    ///
    /// Called automatically at start; calling it twice has no effect.
    ///
    /// @throws ConfigurationError for unresolvable references.
    void finalize();

    [[nodiscard]] bool is_finalized() const noexcept { return finalized_; }

    // ------------------------------------------------------- configuration

    /// @brief Set the persistent state storage (not owned); nullptr disables it.
    /// @throws AlreadyFinalizedError after finalize().
    void set_persistent_store(PersistentStore* store);

    [[nodiscard]] PersistentStore* persistent_store() const noexcept { return store_; }

    /// @brief Set the trace writer (not owned); nullptr disables tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void trace(F&& func) {
        if (trace_writer_ != nullptr) {
            trace_writer_->begin(now());
            std::forward<F>(func)(*trace_writer_);
            trace_writer_->end();
        }
    }

    /// @brief Set the debug flag of blocks selected by name or glob pattern.
    /// @return Number of affected blocks.
    /// @throws ConfigurationError for an unknown plain name.
    std::size_t set_debug(bool value, std::string_view pattern);

    /// @brief Set the debug flag of one block.
    std::size_t set_debug(bool value, Block& block);

    /// @brief Set the debug flag of all blocks of type T.
    template<typename T>
    std::size_t set_debug_type(bool value) {
        auto selected = blocks_of<T>();
        for (T* blk : selected) {
            blk->set_debug(value);
        }
        return selected.size();
    }

    void set_circuit_debug(bool value) noexcept { circuit_debug_ = value; }
    [[nodiscard]] bool circuit_debug() const noexcept { return circuit_debug_; }

    // ------------------------------------------------------ time & timers

    /// @brief Current circuit time.
    [[nodiscard]] TimePoint now() const noexcept;

    [[nodiscard]] bool virtual_time() const noexcept { return options_.virtual_time; }

    /// @brief Schedule a one-shot timer callback on the simulation thread.
    TimerId add_timer(TimePoint when, std::function<void()> callback);

    /// @brief Schedule a one-shot timer @p delay from now.
    /// @throws std::invalid_argument for an infinite delay.
    TimerId add_timer(Duration delay, std::function<void()> callback);

    /// @brief Cancel a pending timer; @p timer becomes invalid.
    void cancel_timer(TimerId& timer);

    [[nodiscard]] std::size_t pending_timers() const noexcept { return timers_.size(); }

    // --------------------------------------------------- external actions

    /// @brief Run @p action on the simulation thread.
    ///
    /// Callable from any thread. An exception thrown by the action aborts
    /// the circuit. Actions posted after termination are discarded.
    void post(std::function<void()> action);

    /// @brief Run @p action on the simulation thread and return its result.
    ///
    /// An exception thrown by the action is delivered through the future.
    std::future<Value> submit(std::function<Value()> action);

    /// @brief Send an event to the named block from another thread.
    std::future<Value> send_event(std::string block_name, EventType etype, EventData data = {});

    // ----------------------------------------------------------- lifecycle

    /// @brief Start the circuit and run the simulation until it is stopped.
    ///
    /// Never returns normally: throws CancelledError after a regular
    /// shutdown, or the error that stopped the simulation.
    ///
    /// @throws InvalidStateError if the circuit was already started.
    [[noreturn]] void run_forever();

    /// @brief Manual mode: start and initialize the circuit, settle outputs.
    /// @return false if the simulation was stopped by a cancellation.
    /// @throws the error that stopped the simulation.
    bool initialize();

    /// @brief Manual mode: process pending actions and due timers, settle outputs.
    bool settle();

    /// @brief Manual mode: process everything due up to @p until.
    ///
    /// In virtual time mode the clock jumps from timer to timer and finally
    /// to @p until. In real time mode the call sleeps until @p until.
    bool run_until(TimePoint until);

    /// @brief Manual mode: run_until(now() + @p delta).
    bool advance(Duration delta) { return run_until(now() + delta); }

    /// @brief Block until the circuit is running.
    /// @throws InvalidStateError if the simulation has finished or when
    ///         called from the simulation thread.
    void wait_init();

    /// @brief Stop the simulation and wait for its termination.
    /// @throws InvalidStateError when called from the simulation thread.
    /// @throws the retained error if it is not a cancellation.
    void shutdown();

    /// @brief Stop the simulation due to @p error.
    ///
    /// The first error is retained. Later aborts are ignored; they are
    /// logged unless identical to the retained error or a cancellation.
    /// Callable from any thread.
    void abort(std::exception_ptr error);

    template<typename E>
    void abort(E error) {
        abort(std::make_exception_ptr(std::move(error)));
    }

    /// @brief The retained error, nullptr if none.
    [[nodiscard]] std::exception_ptr error() const;

    [[nodiscard]] CircuitState state() const;

    /// @brief True while running without error.
    [[nodiscard]] bool is_ready() const noexcept { return ready_.load(); }

    // ----------------------------------------------------- used by blocks

    /// @brief Run the pending initialization steps of @p block.
    /// @param full Run all steps at once (eager initialization).
    void init_sblock(SBlock& block, bool full);

    /// @brief Save the state of a persistent block (best effort).
    void save_persistent_state(SBlock& block);

    /// @brief Queue the output change of @p block for propagation.
    void notify_output_change(SBlock& block);

private:
    struct TaskSpec {
        Block* block;
        std::function<void(std::stop_token)> func;
        Duration timeout;
    };

    class SimThreadScope;

    template<typename... Args>
    void log_debug(fmt::format_string<Args...> format, Args&&... args) const {
        if (circuit_debug_) {
            logger()->debug("circuit: {}", fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template<typename T, typename... Args>
    T& add_internal(Args&&... args) {
        auto block = std::make_unique<T>(*this, std::forward<Args>(args)...);
        T& ref = *block;
        register_block(std::move(block), true);
        return ref;
    }

    void check_not_finalized() const;
    void register_block(std::unique_ptr<Block> block, bool internal);
    void resolve_inputs(CBlock& block);
    const Value* resolve_input(CBlock& block, const InputRef& ref);

    // kernel
    void propagate();
    [[nodiscard]] CBlock* select_block() const;
    bool idle_step(std::optional<TimePoint> deadline);
    void fire_timer();

    // persistence (lifecycle.cpp)
    void check_persistent_data();
    void init_from_persistent_data(SBlock& block, Persistent& persistent);

    // lifecycle (lifecycle.cpp)
    void begin_run(bool manual);
    void startup();
    void init_async();
    void run_tasks(std::string_view jobname, std::vector<TaskSpec> tasks, bool cancel_on_abort);
    void launch_main_task(Block& block, MainTask& task);
    void terminate();
    void stop_blocks();
    void set_state(CircuitState state);
    void throw_if_aborted() const;
    bool manual_step(const std::function<void()>& step);
    [[nodiscard]] bool on_sim_thread() const noexcept;

    Options options_;
    std::vector<std::unique_ptr<Block>> blocks_;
    std::map<std::string, Block*, std::less<>> names_;
    ConstPool consts_;
    bool finalized_{false};
    PersistentStore* store_{nullptr};
    TraceWriter* trace_writer_{nullptr};
    bool circuit_debug_{false};
    std::optional<TimePoint> persistent_ts_;

    // simulation thread only
    std::map<TimerKey, std::function<void()>> timers_;
    uint64_t timer_sequence_{0};
    std::deque<SBlock*> changed_;
    std::set<CBlock*, BlockOrder> eval_set_;
    std::vector<Block*> started_;
    bool start_ok_{false};
    std::atomic<int64_t> virtual_ns_{0};

    // shared with other threads, guarded by mutex_
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<std::function<void()>> inbox_;
    std::exception_ptr error_;
    CircuitState state_{CircuitState::Building};
    bool run_started_{false};
    bool manual_{false};
    std::atomic<bool> ready_{false};
    std::atomic<std::thread::id> sim_thread_{};

    // destroyed first: main tasks may still post to the circuit
    std::map<Block*, std::jthread, BlockOrder> main_tasks_;
};

} // namespace circsim::core
