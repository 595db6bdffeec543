#include <circsim/core/circuit.hpp>
#include <circsim/core/builtin.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

#include <fnmatch.h>

#include <chrono>
#include <stdexcept>

namespace circsim::core {

namespace {

TimePoint system_now() noexcept {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return time_from_nanoseconds(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

bool is_glob(std::string_view pattern) {
    return pattern.find_first_of("*?[") != std::string_view::npos;
}

} // anonymous namespace

std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Building: return "building";
        case CircuitState::Finalized: return "finalized";
        case CircuitState::Starting: return "starting";
        case CircuitState::Initializing: return "initializing";
        case CircuitState::Running: return "running";
        case CircuitState::Stopping: return "stopping";
        case CircuitState::Terminated: return "terminated";
    }
    return "unknown";
}

Circuit::Circuit()
    : Circuit(Options{}) {}

Circuit::Circuit(Options options)
    : options_(std::move(options)) {
    if (options_.max_evals_per_block == 0) {
        throw ConfigurationError("max_evals_per_block must be positive");
    }
    TimePoint start = options_.start_time.value_or(system_now());
    virtual_ns_.store(duration_to_nanoseconds(start.time_since_epoch()));
}

Circuit::~Circuit() {
    main_tasks_.clear();
}

// ------------------------------------------------------------------ registry

void Circuit::check_not_finalized() const {
    if (error()) {
        throw InvalidStateError("The circuit was shut down");
    }
    if (finalized_) {
        throw AlreadyFinalizedError("No changes allowed in a finalized circuit");
    }
}

void Circuit::register_block(std::unique_ptr<Block> block, bool internal) {
    std::string& name = block->name_;
    if (name.empty()) {
        std::string prefix = fmt::format("_{}_", block->type_name());
        std::size_t index = 0;
        do {
            name = fmt::format("{}{}", prefix, index++);
        } while (names_.contains(name));
    } else {
        if (name.front() == '_' && !internal) {
            throw ConfigurationError(
                fmt::format("'{}' is a reserved name (starting with an underscore)", name));
        }
        if (names_.contains(name)) {
            throw ConfigurationError(fmt::format("Duplicate block name '{}'", name));
        }
    }
    block->id_ = blocks_.size();
    names_.emplace(name, block.get());
    blocks_.push_back(std::move(block));
}

Block* Circuit::find_block(std::string_view name) const noexcept {
    auto it = names_.find(name);
    return it == names_.end() ? nullptr : it->second;
}

Block& Circuit::block(std::string_view name) const {
    Block* found = find_block(name);
    if (found == nullptr) {
        throw ConfigurationError(fmt::format("Block '{}' not found", name));
    }
    return *found;
}

Block& Circuit::resolve_name(std::string_view name) {
    if (Block* found = find_block(name)) {
        return *found;
    }
    if (!finalized_ && name == CONTROL_BLOCK_NAME) {
        return add_internal<ControlBlock>(BlockOptions{
            .name = std::string(name),
            .comment = "Simulation Control Block",
        });
    }
    if (!finalized_ && name.starts_with(INVERTER_PREFIX) && name.size() > INVERTER_PREFIX.size()
        && name[INVERTER_PREFIX.size()] != '_') {
        auto& inverter = add_internal<Not>(BlockOptions{
            .name = std::string(name),
            .comment = fmt::format("Inverted output of {}", name.substr(INVERTER_PREFIX.size())),
        });
        inverter.connect({std::string(name.substr(INVERTER_PREFIX.size()))});
        return inverter;
    }
    return block(name);
}

const Value* Circuit::resolve_input(CBlock& blk, const InputRef& ref) {
    Block* source = nullptr;
    const Value* value = std::visit([&](const auto& item) -> const Value* {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, Block*>) {
            if (&item->circuit() != this || find_block(item->name()) != item) {
                throw ConfigurationError(fmt::format("{} is not in the current circuit", item->to_string()));
            }
            source = item;
            return &item->output_;
        } else if constexpr (std::is_same_v<T, std::string>) {
            source = &resolve_name(item);
            return &source->output_;
        } else if constexpr (std::is_same_v<T, const Const*>) {
            return &item->output();
        } else {
            return &consts_.get(item).output();
        }
    }, ref.ref());
    if (source != nullptr) {
        blk.iconnections_.insert(source);
        source->oconnections_.insert(&blk);
    }
    return value;
}

void Circuit::resolve_inputs(CBlock& blk) {
    if (!blk.connected_) {
        throw ConfigurationError(fmt::format("{}: inputs are not connected", blk.to_string()));
    }
    try {
        for (const auto& [name, ref] : blk.pending_.singles_) {
            blk.inputs_[name] = CBlock::ResolvedInput{false, {resolve_input(blk, ref)}};
        }
        for (const auto& [name, refs] : blk.pending_.groups_) {
            CBlock::ResolvedInput resolved{true, {}};
            for (const auto& ref : refs) {
                resolved.values.push_back(resolve_input(blk, ref));
            }
            blk.inputs_[name] = std::move(resolved);
        }
    } catch (const ConfigurationError& e) {
        throw ConfigurationError(fmt::format("failed connection to {}: {}", blk.to_string(), e.what()));
    }
}

void Circuit::finalize() {
    if (finalized_) {
        return;
    }
    // resolving may append inverter blocks, index-based iteration picks them up
    auto resolve_all_inputs = [this] {
        for (std::size_t i = 0; i < blocks_.size(); ++i) {
            if (auto* cblk = dynamic_cast<CBlock*>(blocks_[i].get()); cblk != nullptr && cblk->inputs_.empty()) {
                resolve_inputs(*cblk);
            }
        }
    };
    resolve_all_inputs();
    for (std::size_t i = 0; i < blocks_.size(); ++i) {
        blocks_[i]->resolve_references();
    }
    resolve_all_inputs();
    finalized_ = true;
    set_state(CircuitState::Finalized);
    log_debug("finalized, {} block(s)", blocks_.size());
}

// ------------------------------------------------------------- configuration

void Circuit::set_persistent_store(PersistentStore* store) {
    check_not_finalized();
    store_ = store;
}

std::size_t Circuit::set_debug(bool value, std::string_view pattern) {
    if (!is_glob(pattern)) {
        block(pattern).set_debug(value);
        return 1;
    }
    std::string pattern_str(pattern);
    std::size_t count = 0;
    for (auto& blk : blocks_) {
        if (fnmatch(pattern_str.c_str(), blk->name().c_str(), 0) == 0) {
            blk->set_debug(value);
            ++count;
        }
    }
    return count;
}

std::size_t Circuit::set_debug(bool value, Block& blk) {
    if (&blk.circuit() != this) {
        throw ConfigurationError(fmt::format("{} is not in the current circuit", blk.to_string()));
    }
    blk.set_debug(value);
    return 1;
}

// ----------------------------------------------------------- time & timers

TimePoint Circuit::now() const noexcept {
    if (options_.virtual_time) {
        return time_from_nanoseconds(virtual_ns_.load());
    }
    return system_now();
}

TimerId Circuit::add_timer(TimePoint when, std::function<void()> callback) {
    auto it = timers_.emplace(TimerKey{when, timer_sequence_++}, std::move(callback)).first;
    return TimerId(it, when);
}

TimerId Circuit::add_timer(Duration delay, std::function<void()> callback) {
    if (delay.is_infinite()) {
        throw std::invalid_argument("cannot schedule a timer with an infinite delay");
    }
    return add_timer(now() + delay, std::move(callback));
}

void Circuit::cancel_timer(TimerId& timer) {
    if (!timer.valid()) {
        return;
    }
    timers_.erase(timer.it_);
    timer.invalidate();
}

// ---------------------------------------------------------- external actions

void Circuit::post(std::function<void()> action) {
    {
        std::lock_guard lock(mutex_);
        if (state_ == CircuitState::Terminated) {
            logger()->debug("circuit: action posted after termination discarded");
            return;
        }
        inbox_.push_back(std::move(action));
    }
    cond_.notify_all();
}

std::future<Value> Circuit::submit(std::function<Value()> action) {
    auto task = std::make_shared<std::packaged_task<Value()>>(std::move(action));
    std::future<Value> result = task->get_future();
    post([task] { (*task)(); });
    return result;
}

std::future<Value> Circuit::send_event(std::string block_name, EventType etype, EventData data) {
    return submit([this, name = std::move(block_name), etype = std::move(etype), data = std::move(data)] {
        auto* dest = dynamic_cast<SBlock*>(&block(name));
        if (dest == nullptr) {
            throw ConfigurationError(fmt::format("{} is not a sequential block", block(name).to_string()));
        }
        return dest->event(etype, data);
    });
}

// -------------------------------------------------------------------- kernel

void Circuit::notify_output_change(SBlock& blk) {
    changed_.push_back(&blk);
}

CBlock* Circuit::select_block() const {
    CBlock* best = nullptr;
    std::size_t best_deps = 0;
    for (CBlock* blk : eval_set_) {
        std::size_t deps = 0;
        for (Block* input : blk->iconnections()) {
            if (eval_set_.contains(input)) {
                ++deps;
            }
        }
        if (deps == 0) {
            return blk;
        }
        if (best == nullptr || deps < best_deps) {
            best = blk;
            best_deps = deps;
        }
    }
    return best;
}

void Circuit::propagate() {
    const std::size_t limit = options_.max_evals_per_block * blocks_.size();
    std::size_t eval_count = 0;
    for (;;) {
        while (!changed_.empty()) {
            SBlock* blk = changed_.front();
            changed_.pop_front();
            eval_set_.insert(blk->oconnections().begin(), blk->oconnections().end());
        }
        if (eval_set_.empty()) {
            break;
        }
        if (++eval_count > limit) {
            throw InstabilityError("Circuit instability detected (too many block evaluations)");
        }
        CBlock* blk = select_block();
        eval_set_.erase(blk);
        bool changed = false;
        try {
            changed = blk->eval_block();
        } catch (const CircuitError&) {
            throw;
        } catch (const std::exception& e) {
            throw BlockError(fmt::format("{}: output evaluation error: {}", blk->to_string(), e.what()));
        }
        if (changed) {
            eval_set_.insert(blk->oconnections().begin(), blk->oconnections().end());
        }
    }
    if (eval_count > 0) {
        log_debug("{} block evaluation(s), pausing", eval_count);
    }
}

void Circuit::fire_timer() {
    auto it = timers_.begin();
    if (options_.virtual_time && it->first.when > now()) {
        virtual_ns_.store(duration_to_nanoseconds(it->first.when.time_since_epoch()));
    }
    std::function<void()> callback = std::move(it->second);
    timers_.erase(it);
    callback();
}

bool Circuit::idle_step(std::optional<TimePoint> deadline) {
    std::unique_lock lock(mutex_);
    for (;;) {
        if (error_) {
            return false;
        }
        if (!inbox_.empty()) {
            std::function<void()> action = std::move(inbox_.front());
            inbox_.pop_front();
            lock.unlock();
            action();
            return true;
        }
        std::optional<TimePoint> next_timer;
        if (!timers_.empty()) {
            next_timer = timers_.begin()->first.when;
        }
        if (options_.virtual_time) {
            if (next_timer && (!deadline || *next_timer <= *deadline)) {
                lock.unlock();
                fire_timer();
                return true;
            }
            if (deadline) {
                if (*deadline > now()) {
                    virtual_ns_.store(duration_to_nanoseconds(deadline->time_since_epoch()));
                }
                return false;
            }
            // nothing can happen without an external action
            cond_.wait(lock);
            continue;
        }
        TimePoint current = now();
        if (next_timer && *next_timer <= current) {
            lock.unlock();
            fire_timer();
            return true;
        }
        if (deadline && *deadline <= current) {
            return false;
        }
        std::optional<TimePoint> wake = next_timer;
        if (deadline && (!wake || *deadline < *wake)) {
            wake = deadline;
        }
        if (wake) {
            auto delay = std::chrono::nanoseconds(duration_to_nanoseconds(*wake - current));
            cond_.wait_for(lock, delay);
        } else {
            cond_.wait(lock);
        }
    }
}

} // namespace circsim::core
