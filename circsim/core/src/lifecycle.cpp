#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <set>

namespace circsim::core {

namespace {

bool is_cancellation(const std::exception_ptr& error) {
    if (!error) {
        return false;
    }
    try {
        std::rethrow_exception(error);
    } catch (const CancelledError&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // anonymous namespace

class Circuit::SimThreadScope {
public:
    explicit SimThreadScope(Circuit& circuit)
        : circuit_(circuit)
        , previous_(circuit.sim_thread_.exchange(std::this_thread::get_id())) {}

    ~SimThreadScope() { circuit_.sim_thread_.store(previous_); }

    SimThreadScope(const SimThreadScope&) = delete;
    SimThreadScope& operator=(const SimThreadScope&) = delete;

private:
    Circuit& circuit_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::thread::id previous_;
};

// ------------------------------------------------------------- error & state

void Circuit::abort(std::exception_ptr err) {
    if (!err) {
        return;
    }
    bool first = false;
    bool ignored = false;
    {
        std::lock_guard lock(mutex_);
        if (!error_) {
            error_ = err;
            ready_.store(false);
            first = true;
        } else if (err != error_ && !is_cancellation(err)) {
            ignored = true;
        }
    }
    cond_.notify_all();
    if (first) {
        if (is_cancellation(err)) {
            log_debug("abort({})", describe(err));
        } else {
            logger()->warn("abort({})", describe(err));
        }
        if (on_sim_thread()) {
            trace([&](TraceWriter& w) {
                w.type("abort");
                w.field("error", describe(err));
            });
        }
    } else if (ignored) {
        logger()->warn("ignoring subsequent abort({})", describe(err));
    }
}

std::exception_ptr Circuit::error() const {
    std::lock_guard lock(mutex_);
    return error_;
}

CircuitState Circuit::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

void Circuit::set_state(CircuitState state) {
    {
        std::lock_guard lock(mutex_);
        state_ = state;
    }
    cond_.notify_all();
}

void Circuit::throw_if_aborted() const {
    if (auto err = error()) {
        std::rethrow_exception(err);
    }
}

bool Circuit::on_sim_thread() const noexcept {
    return sim_thread_.load() == std::this_thread::get_id();
}

// -------------------------------------------------------------- persistence

void Circuit::check_persistent_data() {
    std::vector<std::pair<SBlock*, Persistent*>> persistent_blocks;
    for (SBlock* blk : blocks_of<SBlock>()) {
        if (auto* persistent = dynamic_cast<Persistent*>(blk); persistent != nullptr && persistent->persistence_enabled()) {
            persistent_blocks.emplace_back(blk, persistent);
        }
    }
    if (store_ == nullptr) {
        if (!persistent_blocks.empty()) {
            logger()->warn("No data storage, state persistence unavailable");
            for (auto& [blk, persistent] : persistent_blocks) {
                persistent->disable_persistence();
            }
        }
        return;
    }

    try {
        std::optional<Value> timestamp = store_->get(STOP_TIME_KEY);
        if (timestamp && timestamp->is_number()) {
            persistent_ts_ = time_from_seconds(timestamp->as_double());
            if (*persistent_ts_ > now()) {
                logger()->error("The timestamp of persistent data is in the future, check the system time");
            }
        } else {
            persistent_ts_.reset();
            logger()->warn("The timestamp of persistent data is missing or invalid, "
                           "state expiration will not be checked");
        }

        std::set<std::string, std::less<>> used;
        for (auto& [blk, persistent] : persistent_blocks) {
            used.insert(blk->to_string());
        }
        for (const auto& key : store_->keys()) {
            if (key.starts_with(RESERVED_KEY_PREFIX) || used.contains(key)) {
                continue;
            }
            logger()->info("Removing unused persistent state for '{}'", key);
            store_->erase(key);
        }
    } catch (const std::exception& e) {
        logger()->error("Persistent data check failed: {}", e.what());
    }
}

void Circuit::init_from_persistent_data(SBlock& blk, Persistent& persistent) {
    if (store_ == nullptr) {
        return;
    }
    std::optional<Value> saved;
    try {
        saved = store_->get(blk.to_string());
    } catch (const std::exception& e) {
        blk.log_warning("Persistent data retrieval error: {}", e.what());
        return;
    }
    if (!saved) {
        return;
    }
    if (const auto& expiration = persistent.expiration()) {
        if (*expiration <= Duration::zero()) {
            return;
        }
        if (persistent_ts_ && !expiration->is_infinite() && *persistent_ts_ + *expiration < now()) {
            blk.log_debug("The saved state has expired");
            return;
        }
    }
    try {
        persistent.restore_state(*saved);
    } catch (const std::exception& e) {
        blk.log_warning("Error restoring saved state {}: {}", *saved, e.what());
    }
}

void Circuit::save_persistent_state(SBlock& blk) {
    auto* persistent = dynamic_cast<Persistent*>(&blk);
    if (store_ == nullptr || persistent == nullptr || !persistent->persistence_enabled()) {
        return;
    }
    std::string key = blk.to_string();
    try {
        store_->set(key, blk.get_state());
    } catch (const std::exception& e) {
        blk.log_warning("Persistent data save error: {}", e.what());
        try {
            store_->erase(key);
        } catch (const std::exception& cleanup) {
            blk.log_warning("Persistent data cleanup error: {}", cleanup.what());
        }
    }
}

// ------------------------------------------------------------ initialization

void Circuit::init_sblock(SBlock& blk, bool full) {
    const int steps = blk.init_steps_completed_;
    try {
        if (steps == 0) {
            if (auto* persistent = dynamic_cast<Persistent*>(&blk);
                persistent != nullptr && persistent->persistence_enabled()) {
                init_from_persistent_data(blk, *persistent);
                if (blk.is_initialized()) {
                    blk.log_debug("initialized from saved state");
                }
            }
            blk.init_steps_completed_ = 1;
        }
        if (steps == 1 || (steps == 0 && full)) {
            if (!blk.is_initialized()) {
                blk.init_regular();
            }
            if (auto* value_init = dynamic_cast<ValueInit*>(&blk);
                value_init != nullptr && !blk.is_initialized() && !value_init->initdef().is_undef()) {
                value_init->init_from_value(value_init->initdef());
            }
            blk.init_steps_completed_ = 2;
        }
    } catch (const CircuitError&) {
        throw;
    } catch (const std::exception& e) {
        throw BlockError(fmt::format("{}: initialization error: {}", blk.to_string(), e.what()));
    }
}

void Circuit::init_async() {
    std::vector<TaskSpec> tasks;
    for (SBlock* blk : blocks_of<SBlock>()) {
        auto* async = dynamic_cast<AsyncInit*>(blk);
        if (async != nullptr && !blk->is_initialized() && async->init_timeout() > Duration::zero()) {
            tasks.push_back(TaskSpec{
                blk, [async](std::stop_token token) { async->init_async(std::move(token)); }, async->init_timeout()});
        }
    }
    if (!tasks.empty()) {
        log_debug("Initializing async sequential blocks");
        run_tasks("init", std::move(tasks), true);
    }
}

void Circuit::run_tasks(std::string_view jobname, std::vector<TaskSpec> tasks, bool cancel_on_abort) {
    using Clock = std::chrono::steady_clock;
    struct Slot {
        bool done{false};
        bool timed_out{false};
        std::exception_ptr error;
        Clock::time_point deadline;
    };

    std::vector<Slot> slots(tasks.size());
    std::vector<std::jthread> threads;
    threads.reserve(tasks.size());
    const auto start = Clock::now();
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        const Duration timeout = tasks[i].timeout;
        slots[i].deadline = timeout.is_infinite()
            ? Clock::time_point::max()
            : start + std::chrono::nanoseconds(duration_to_nanoseconds(timeout));
        threads.emplace_back([this, slot = &slots[i], func = tasks[i].func](std::stop_token token) {
            std::exception_ptr failure;
            try {
                func(std::move(token));
            } catch (...) {
                // reported by run_tasks() once the task has been joined
                failure = std::current_exception();
            }
            {
                std::lock_guard lock(mutex_);
                slot->error = failure;
                slot->done = true;
            }
            cond_.notify_all();
        });
    }

    std::size_t error_count = 0;
    std::unique_lock lock(mutex_);
    for (;;) {
        if (!inbox_.empty()) {
            std::function<void()> action = std::move(inbox_.front());
            inbox_.pop_front();
            lock.unlock();
            action();
            lock.lock();
            continue;
        }
        const auto current = Clock::now();
        auto next_deadline = Clock::time_point::max();
        bool pending = false;
        for (std::size_t i = 0; i < tasks.size(); ++i) {
            Slot& slot = slots[i];
            if (slot.done || slot.timed_out) {
                continue;
            }
            if (current >= slot.deadline) {
                slot.timed_out = true;
                threads[i].request_stop();
                ++error_count;
                tasks[i].block->log_warning("{} timeout, check timeout value ({:.1f} s)",
                                            jobname, tasks[i].timeout.seconds());
                continue;
            }
            pending = true;
            next_deadline = std::min(next_deadline, slot.deadline);
        }
        if (!pending) {
            break;
        }
        if (cancel_on_abort && error_) {
            for (auto& thread : threads) {
                thread.request_stop();
            }
            break;
        }
        if (next_deadline == Clock::time_point::max()) {
            cond_.wait(lock);
        } else {
            cond_.wait_until(lock, next_deadline);
        }
    }
    lock.unlock();

    // request_stop() and join
    threads.clear();
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (slots[i].error) {
            // a timed out task was counted already
            if (!slots[i].timed_out) {
                ++error_count;
            }
            tasks[i].block->log_error("{} error: {}", jobname, describe(slots[i].error));
        }
    }
    if (error_count > 0) {
        logger()->error("{} block {} error(s) suppressed", error_count, jobname);
    }
}

void Circuit::launch_main_task(Block& blk, MainTask& task) {
    main_tasks_.emplace(&blk, std::jthread([this, &blk, &task](std::stop_token token) {
        try {
            task.main_task(token);
            if (!token.stop_requested()) {
                abort(CircuitError(fmt::format("{}: Unexpected main task termination", blk.to_string())));
            }
        } catch (const CircuitError&) {
            abort(std::current_exception());
        } catch (const std::exception& e) {
            abort(BlockError(fmt::format("{}: main task error: {}", blk.to_string(), e.what())));
        }
    }));
}

// ----------------------------------------------------------------- lifecycle

void Circuit::begin_run(bool manual) {
    std::lock_guard lock(mutex_);
    if (run_started_) {
        throw InvalidStateError(state_ == CircuitState::Terminated
                                    ? "Cannot restart a finished simulation"
                                    : "The simulation is already running");
    }
    run_started_ = true;
    manual_ = manual;
}

void Circuit::startup() {
    throw_if_aborted();
    if (blocks_.empty()) {
        throw InvalidStateError("The circuit is empty");
    }
    log_debug("Initializing the circuit");
    finalize();
    check_persistent_data();
    trace([&](TraceWriter& w) {
        w.type("sim_start");
        w.field("blocks", static_cast<uint64_t>(blocks_.size()));
    });

    set_state(CircuitState::Starting);
    log_debug("Setting up circuit blocks");
    for (const auto& blk : blocks_) {
        blk->start();
        started_.push_back(blk.get());
        if (auto* task = dynamic_cast<MainTask*>(blk.get())) {
            launch_main_task(*blk, *task);
        }
    }
    start_ok_ = true;

    set_state(CircuitState::Initializing);
    log_debug("Initializing sequential blocks");
    const auto sblocks = blocks_of<SBlock>();
    for (SBlock* blk : sblocks) {
        init_sblock(*blk, false);
    }
    init_async();
    for (SBlock* blk : sblocks) {
        init_sblock(*blk, false);
    }
    throw_if_aborted();
    for (SBlock* blk : sblocks) {
        if (!blk->is_initialized()) {
            throw InitializationError(fmt::format("{}: not initialized", blk->to_string()));
        }
    }
    if (store_ != nullptr) {
        for (SBlock* blk : sblocks) {
            save_persistent_state(*blk);
        }
    }

    changed_.clear();
    eval_set_.clear();
    for (CBlock* blk : blocks_of<CBlock>()) {
        eval_set_.insert(blk);
    }
    ready_.store(true);
    set_state(CircuitState::Running);
    log_debug("Starting simulation");
}

void Circuit::run_forever() {
    begin_run(false);
    SimThreadScope scope(*this);
    try {
        startup();
        for (;;) {
            propagate();
            if (!idle_step(std::nullopt)) {
                break;
            }
        }
    } catch (const std::exception&) {
        abort(std::current_exception());
    }
    terminate();
    std::rethrow_exception(error());
}

bool Circuit::manual_step(const std::function<void()>& step) {
    {
        std::unique_lock lock(mutex_);
        if (!run_started_ || !manual_) {
            throw InvalidStateError("The circuit is not driven in manual mode");
        }
        if (state_ == CircuitState::Terminated) {
            std::exception_ptr err = error_;
            lock.unlock();
            if (is_cancellation(err)) {
                return false;
            }
            std::rethrow_exception(err);
        }
    }
    SimThreadScope scope(*this);
    try {
        step();
    } catch (const std::exception&) {
        abort(std::current_exception());
    }
    std::exception_ptr err = error();
    if (!err) {
        return true;
    }
    terminate();
    if (is_cancellation(err)) {
        return false;
    }
    std::rethrow_exception(err);
}

bool Circuit::initialize() {
    begin_run(true);
    return manual_step([this] {
        startup();
        propagate();
    });
}

bool Circuit::settle() {
    return manual_step([this] {
        do {
            propagate();
        } while (idle_step(now()));
    });
}

bool Circuit::run_until(TimePoint until) {
    return manual_step([this, until] {
        do {
            propagate();
        } while (idle_step(until));
    });
}

void Circuit::wait_init() {
    if (on_sim_thread()) {
        throw InvalidStateError("wait_init() called from the simulation thread");
    }
    std::unique_lock lock(mutex_);
    cond_.wait(lock, [this] {
        return state_ == CircuitState::Running || state_ == CircuitState::Stopping
            || state_ == CircuitState::Terminated;
    });
    if (state_ != CircuitState::Running) {
        throw InvalidStateError(fmt::format("The simulation has finished: {}", describe(error_)));
    }
}

void Circuit::shutdown() {
    if (on_sim_thread()) {
        throw InvalidStateError("shutdown() called from the simulation thread");
    }
    bool started = false;
    bool manual = false;
    {
        std::lock_guard lock(mutex_);
        started = run_started_;
        manual = manual_;
    }
    abort(CancelledError("shutdown"));
    if (!started) {
        return;
    }
    if (manual) {
        if (state() != CircuitState::Terminated) {
            SimThreadScope scope(*this);
            terminate();
        }
    } else {
        std::unique_lock lock(mutex_);
        cond_.wait(lock, [this] { return state_ == CircuitState::Terminated; });
    }
    std::exception_ptr err = error();
    if (!is_cancellation(err)) {
        std::rethrow_exception(err);
    }
}

// --------------------------------------------------------------- termination

void Circuit::stop_blocks() {
    auto call_stop = [](Block* blk) {
        try {
            blk->stop();
        } catch (const std::exception& e) {
            logger()->error("{}: ignored error in stop(): {}", blk->to_string(), e.what());
        }
    };

    std::vector<TaskSpec> tasks;
    std::vector<Block*> sync_blocks;
    for (Block* blk : started_) {
        auto* async = dynamic_cast<AsyncStop*>(blk);
        if (async == nullptr || async->stop_timeout() <= Duration::zero()) {
            sync_blocks.push_back(blk);
            continue;
        }
        call_stop(blk);
        std::jthread* main_thread = nullptr;
        if (auto it = main_tasks_.find(blk); it != main_tasks_.end()) {
            main_thread = &it->second;
        }
        tasks.push_back(TaskSpec{blk, [async, main_thread](std::stop_token token) {
            if (main_thread != nullptr && main_thread->joinable()) {
                main_thread->request_stop();
                main_thread->join();
            }
            async->stop_async(std::move(token));
        }, async->stop_timeout()});
    }
    if (!tasks.empty()) {
        log_debug("Stopping async blocks");
        run_tasks("stop", std::move(tasks), false);
    }
    for (Block* blk : sync_blocks) {
        call_stop(blk);
    }
}

void Circuit::terminate() {
    ready_.store(false);
    set_state(CircuitState::Stopping);
    std::exception_ptr err = error();
    if (is_cancellation(err)) {
        logger()->info("Normal circuit simulation stop");
    } else {
        logger()->critical("Fatal circuit simulation error: {}", describe(err));
    }

    if (!started_.empty()) {
        if (start_ok_ && store_ != nullptr) {
            for (Block* blk : started_) {
                if (auto* sblk = dynamic_cast<SBlock*>(blk)) {
                    save_persistent_state(*sblk);
                }
            }
            try {
                store_->set(std::string(STOP_TIME_KEY), time_to_seconds(now()));
            } catch (const std::exception& e) {
                logger()->warn("Persistent data save error: {}", e.what());
            }
        }
        stop_blocks();
    }
    if (store_ != nullptr) {
        try {
            store_->flush();
        } catch (const std::exception& e) {
            logger()->error("Persistent data flush error: {}", e.what());
        }
    }

    timers_.clear();
    changed_.clear();
    eval_set_.clear();
    trace([&](TraceWriter& w) {
        w.type("sim_stop");
        w.field("reason", is_cancellation(err) ? std::string("shutdown") : describe(err));
    });

    std::deque<std::function<void()>> discarded;
    {
        std::lock_guard lock(mutex_);
        state_ = CircuitState::Terminated;
        discarded.swap(inbox_);
    }
    cond_.notify_all();
    // pending submit() futures receive broken_promise
    discarded.clear();
    main_tasks_.clear();
}

} // namespace circsim::core
