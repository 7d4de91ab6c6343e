#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace miniflow {

// ==========================================
// 0. Observability: Logger & Metrics
// ==========================================
enum class LogLevel { kDebug, kInfo, kWarn, kError };

using LogFn = std::function<void(LogLevel, const std::string&)>;

inline LogFn StderrLogger(LogLevel min = LogLevel::kInfo) {
  return [min](LogLevel level, const std::string& msg) {
    if (level < min) return;
    static const char* tags[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    std::cerr << "[" << tags[static_cast<int>(level)] << "] " << msg << "\n";
  };
}

// Terminal outcome of Workflow::Execute
enum class Status { kDone, kFailed };

inline const char* StatusName(Status status) {
  return status == Status::kDone ? "DONE" : "FAILED";
}

enum class NodeState {
  kPending,
  kReady,
  kRunning,
  kSucceeded,
  kFailed,
  kSkipped
};

inline const char* NodeStateName(NodeState state) {
  static const char* names[] = {"PENDING",   "READY",  "RUNNING",
                                "SUCCEEDED", "FAILED", "SKIPPED"};
  return names[static_cast<int>(state)];
}

struct NodeMetric {
  std::string name;
  NodeState state = NodeState::kPending;
  int64_t wait_us = 0;      // time spent waiting for a limiter slot
  int64_t duration_us = 0;  // handler run time
  std::string error;
};

// ==========================================
// 1. Errors
// ==========================================
class WorkflowError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Invalid graph or misuse of a Workflow; reported before any handler runs
class ConstructionError : public WorkflowError {
 public:
  using WorkflowError::WorkflowError;
};

class CancellationError : public WorkflowError {
 public:
  using WorkflowError::WorkflowError;
};

// Cancelled while waiting on a ConcurrencyLimiter slot
class LimiterAcquireError : public CancellationError {
 public:
  using CancellationError::CancellationError;
};

inline std::string DescribeException(std::exception_ptr ep) {
  if (!ep) return {};
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

// Wraps whatever a component handler threw
class HandlerError : public WorkflowError {
 public:
  HandlerError(std::string component, std::exception_ptr cause)
      : WorkflowError("component '" + component +
                      "' failed: " + DescribeException(cause)),
        component_(std::move(component)),
        cause_(std::move(cause)) {}

  const std::string& ComponentName() const { return component_; }
  std::exception_ptr Cause() const { return cause_; }

 private:
  std::string component_;
  std::exception_ptr cause_;
};

// ==========================================
// 2. Cancellation Context
// ==========================================

// Copyable handle to a shared cancellation signal. Every copy observes the
// same state; children derived with WithCancel() also fire when the parent
// does.
class Context {
  struct State;

 public:
  // Scoped OnCancel() callback; unregisters on destruction.
  class Registration {
   public:
    Registration() = default;
    Registration(std::shared_ptr<State> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}
    Registration(Registration&& other) noexcept
        : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}
    Registration& operator=(Registration&& other) noexcept {
      if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
      }
      return *this;
    }
    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;
    ~Registration() { Reset(); }

    void Reset();

   private:
    std::shared_ptr<State> state_;
    uint64_t id_ = 0;
  };

  Context();

  static Context Background() { return Context(); }

  Context WithCancel() const;

  void Cancel() const;
  bool IsCancelled() const;

  // Runs fn once when the context is cancelled, or right away if it already
  // is. Once the returned registration is destroyed fn is not running and
  // will not run.
  Registration OnCancel(std::function<void()> fn) const;

 private:
  explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

  std::shared_ptr<State> state_;
};

struct Context::State {
  std::atomic<bool> cancelled{false};
  std::mutex mu;
  std::condition_variable idle;
  std::map<uint64_t, std::function<void()>> callbacks;
  uint64_t next_id = 1;
  bool firing = false;
  std::thread::id firing_thread;

  std::shared_ptr<State> parent;
  uint64_t parent_callback = 0;

  ~State() {
    if (parent && parent_callback != 0) parent->Remove(parent_callback);
  }

  void Fire() {
    std::map<uint64_t, std::function<void()>> pending;
    {
      std::lock_guard<std::mutex> lock(mu);
      if (cancelled.load(std::memory_order_acquire)) return;
      cancelled.store(true, std::memory_order_release);
      pending.swap(callbacks);
      firing = true;
      firing_thread = std::this_thread::get_id();
    }
    for (auto& entry : pending) entry.second();
    {
      std::lock_guard<std::mutex> lock(mu);
      firing = false;
    }
    idle.notify_all();
  }

  // Returns 0 when fn already ran because the state is cancelled
  uint64_t Add(std::function<void()> fn) {
    {
      std::lock_guard<std::mutex> lock(mu);
      if (!cancelled.load(std::memory_order_acquire)) {
        uint64_t id = next_id++;
        callbacks.emplace(id, std::move(fn));
        return id;
      }
    }
    fn();
    return 0;
  }

  void Remove(uint64_t id) {
    std::unique_lock<std::mutex> lock(mu);
    if (callbacks.erase(id) > 0) return;
    // Already handed to Fire(); wait unless Fire() is our own caller
    if (firing && firing_thread != std::this_thread::get_id()) {
      idle.wait(lock, [this] { return !firing; });
    }
  }
};

inline void Context::Registration::Reset() {
  if (state_ && id_ != 0) state_->Remove(id_);
  state_.reset();
  id_ = 0;
}

inline Context::Context() : state_(std::make_shared<State>()) {}

inline Context Context::WithCancel() const {
  auto child = std::make_shared<State>();
  std::weak_ptr<State> weak = child;
  child->parent = state_;
  child->parent_callback = state_->Add([weak] {
    if (auto c = weak.lock()) c->Fire();
  });
  return Context(std::move(child));
}

inline void Context::Cancel() const { state_->Fire(); }

inline bool Context::IsCancelled() const {
  return state_->cancelled.load(std::memory_order_acquire);
}

inline Context::Registration Context::OnCancel(std::function<void()> fn) const {
  uint64_t id = state_->Add(std::move(fn));
  if (id == 0) return Registration();
  return Registration(state_, id);
}

// ==========================================
// 3. Concurrency Limiter
// ==========================================

// Counting semaphore shared by every component (in any workflow) bound to
// it. No fairness between waiters.
class ConcurrencyLimiter {
 public:
  // Holds one slot; releases it when destroyed
  class Slot {
   public:
    Slot() = default;
    explicit Slot(ConcurrencyLimiter* limiter) : limiter_(limiter) {}
    Slot(Slot&& other) noexcept
        : limiter_(std::exchange(other.limiter_, nullptr)) {}
    Slot& operator=(Slot&& other) noexcept {
      if (this != &other) {
        Reset();
        limiter_ = std::exchange(other.limiter_, nullptr);
      }
      return *this;
    }
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    ~Slot() { Reset(); }

    bool Held() const { return limiter_ != nullptr; }

    void Reset() {
      if (limiter_) {
        limiter_->ReleaseOne();
        limiter_ = nullptr;
      }
    }

   private:
    ConcurrencyLimiter* limiter_ = nullptr;
  };

  explicit ConcurrencyLimiter(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("ConcurrencyLimiter capacity must be >= 1");
    }
  }

  ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
  ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

  // Blocks until a slot is free. Throws LimiterAcquireError, without taking
  // a slot, if ctx is or becomes cancelled first.
  void Acquire(const Context& ctx) {
    if (ctx.IsCancelled()) {
      throw LimiterAcquireError("cancelled before acquiring a limiter slot");
    }
    if (TryAcquire()) return;

    auto wakeup = ctx.OnCancel([this] {
      std::lock_guard<std::mutex> lock(mu_);
      cv_.notify_all();
    });
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock,
             [&] { return in_use_ < capacity_ || ctx.IsCancelled(); });
    if (ctx.IsCancelled()) {
      throw LimiterAcquireError("cancelled while waiting for a limiter slot");
    }
    ++in_use_;
  }

  Slot AcquireSlot(const Context& ctx) {
    Acquire(ctx);
    return Slot(this);
  }

  bool TryAcquire() {
    std::lock_guard<std::mutex> lock(mu_);
    if (in_use_ >= capacity_) return false;
    ++in_use_;
    return true;
  }

  void Release() {
    if (!ReleaseOne()) {
      throw std::logic_error("ConcurrencyLimiter released more than acquired");
    }
  }

  size_t Capacity() const { return capacity_; }

  size_t InUse() const {
    std::lock_guard<std::mutex> lock(mu_);
    return in_use_;
  }

 private:
  // False when nothing was held
  bool ReleaseOne() noexcept {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (in_use_ == 0) return false;
      --in_use_;
    }
    cv_.notify_one();
    return true;
  }

  const size_t capacity_;
  size_t in_use_ = 0;
  mutable std::mutex mu_;
  std::condition_variable cv_;
};

inline std::shared_ptr<ConcurrencyLimiter> NewConcurrencyLimiter(size_t max) {
  return std::make_shared<ConcurrencyLimiter>(max);
}

// ==========================================
// 4. Data Tracker
// ==========================================

// The only path from a handler to the workflow's config and result.
template <typename Config, typename Data>
class DataTracker {
 public:
  DataTracker(const Config& config, Data* data)
      : config_(config), data_(data) {}

  DataTracker(const DataTracker&) = delete;
  DataTracker& operator=(const DataTracker&) = delete;

  const Config& GetConfig() const { return config_; }

  // Consistent copy of the result
  Data GetData() const {
    std::lock_guard<std::mutex> lock(mu_);
    return *data_;
  }

  // Read access without a copy; the reference must not escape reader
  template <typename Reader>
  auto Read(Reader&& reader) const {
    std::lock_guard<std::mutex> lock(mu_);
    return reader(static_cast<const Data&>(*data_));
  }

  // Exclusive access for the duration of mutator. A throwing mutator
  // releases the lock and its exception reaches the caller.
  template <typename Mutator>
  auto Update(Mutator&& mutator) {
    std::lock_guard<std::mutex> lock(mu_);
    return mutator(*data_);
  }

 private:
  const Config& config_;
  Data* data_;
  mutable std::mutex mu_;
};

// ==========================================
// 5. Component
// ==========================================
template <typename Config, typename Data>
class Workflow;

struct ComponentOptions {
  std::shared_ptr<ConcurrencyLimiter> limiter;  // null = unbounded
};

template <typename Config, typename Data>
class Component {
 public:
  using Tracker = DataTracker<Config, Data>;
  using Invoker =
      std::function<void(const Context&, const std::any&, Tracker&)>;

  // handler_input is the type the handler was declared with; std::any
  // accepts every input.
  Component(std::string name, std::any input, std::type_index handler_input,
            Invoker invoker)
      : name_(std::move(name)),
        input_(std::move(input)),
        invoker_(std::move(invoker)) {
    if (!invoker_) {
      throw std::invalid_argument("Component '" + name_ + "' has no handler");
    }
    if (handler_input != std::type_index(typeid(std::any)) &&
        std::type_index(input_.type()) != handler_input) {
      throw std::invalid_argument("Component '" + name_ + "': input type " +
                                  input_.type().name() +
                                  " does not match handler input type " +
                                  handler_input.name());
    }
  }

  Component(const Component&) = delete;
  Component& operator=(const Component&) = delete;

  const std::string& Name() const { return name_; }
  const std::any& Input() const { return input_; }
  const std::shared_ptr<ConcurrencyLimiter>& Limiter() const {
    return limiter_;
  }

  // Declares edges dep -> this. Validated when the workflow executes.
  template <typename... Deps>
  Component& AddDependencies(Deps*... deps) {
    static_assert((std::is_convertible_v<Deps*, const Component*> && ...),
                  "dependencies must be components of the same workflow type");
    (AddDependency(deps), ...);
    return *this;
  }

  Component& AddDependencies(const std::vector<Component*>& deps) {
    for (const Component* dep : deps) AddDependency(dep);
    return *this;
  }

  size_t DependencyCount() const { return deps_.size(); }

 private:
  friend class Workflow<Config, Data>;

  struct Edge {
    const Component* target;
    uint64_t owner_id;  // workflow the target belonged to when declared
  };

  void AddDependency(const Component* dep) {
    if (frozen_.load(std::memory_order_acquire)) {
      throw std::logic_error("Component '" + name_ +
                             "': dependencies are fixed once Execute starts");
    }
    if (dep == nullptr) {
      throw std::invalid_argument("Component '" + name_ +
                                  "': null dependency");
    }
    for (const auto& edge : deps_) {
      if (edge.target == dep) return;
    }
    deps_.push_back({dep, dep->owner_id_});
  }

  std::string name_;
  std::any input_;
  Invoker invoker_;
  std::shared_ptr<ConcurrencyLimiter> limiter_;
  std::vector<Edge> deps_;
  uint64_t owner_id_ = 0;
  std::atomic<bool> frozen_{false};
};

// ==========================================
// 6. Workflow (Graph Validation & Scheduler)
// ==========================================

// error is set exactly when status != kDone
template <typename Data>
struct ExecuteResult {
  Data* data = nullptr;
  Status status = Status::kFailed;
  std::exception_ptr error;

  bool Ok() const { return status == Status::kDone; }
  std::string ErrorMessage() const { return DescribeException(error); }
  void ThrowIfFailed() const {
    if (error) std::rethrow_exception(error);
  }
};

inline uint64_t NextWorkflowId() {
  static std::atomic<uint64_t> next{1};
  return next.fetch_add(1, std::memory_order_relaxed);
}

template <typename Config, typename Data>
class Workflow {
 public:
  using Tracker = DataTracker<Config, Data>;
  using ComponentT = Component<Config, Data>;
  using Result = ExecuteResult<Data>;

  explicit Workflow(std::string name = "workflow", LogFn log = {})
      : id_(NextWorkflowId()), name_(std::move(name)), log_(std::move(log)) {}

  Workflow(const Workflow&) = delete;
  Workflow& operator=(const Workflow&) = delete;

  ~Workflow() { JoinWorkers(); }

  // Handler signature: void(const Context&, const Input&, Tracker&).
  // Handlers report failure by throwing.
  template <typename Input, typename Handler>
  static std::unique_ptr<ComponentT> MakeComponent(std::string name,
                                                   Input input,
                                                   Handler handler) {
    if constexpr (std::is_same_v<Input, std::any>) {
      static_assert(std::is_invocable_v<const Handler&, const Context&,
                                        const std::any&, Tracker&>,
                    "handler must accept (const Context&, const std::any&, "
                    "DataTracker&)");
      return std::make_unique<ComponentT>(
          std::move(name), std::move(input), std::type_index(typeid(std::any)),
          [h = std::move(handler)](const Context& ctx, const std::any& in,
                                   Tracker& dt) { h(ctx, in, dt); });
    } else {
      static_assert(std::is_invocable_v<const Handler&, const Context&,
                                        const Input&, Tracker&>,
                    "handler input type must match the component input");
      return std::make_unique<ComponentT>(
          std::move(name), std::any(std::move(input)),
          std::type_index(typeid(Input)),
          [h = std::move(handler)](const Context& ctx, const std::any& in,
                                   Tracker& dt) {
            h(ctx, std::any_cast<const Input&>(in), dt);
          });
    }
  }

  // Input arrives boxed; checked against the handler's Input type here
  // rather than at compile time. Throws std::invalid_argument on mismatch.
  template <typename Input, typename Handler>
  static std::unique_ptr<ComponentT> MakeBoxedComponent(std::string name,
                                                        std::any input,
                                                        Handler handler) {
    static_assert(std::is_invocable_v<const Handler&, const Context&,
                                      const Input&, Tracker&>,
                  "handler must accept the declared Input type");
    return std::make_unique<ComponentT>(
        std::move(name), std::move(input), std::type_index(typeid(Input)),
        [h = std::move(handler)](const Context& ctx, const std::any& in,
                                 Tracker& dt) {
          h(ctx, std::any_cast<const Input&>(in), dt);
        });
  }

  // Returned pointer stays valid for the workflow's lifetime and is only
  // meant for AddDependencies().
  ComponentT* AddComponent(std::unique_ptr<ComponentT> component,
                           ComponentOptions options = {}) {
    if (!component) {
      throw std::invalid_argument("AddComponent: null component");
    }
    if (started_.load(std::memory_order_acquire)) {
      throw std::logic_error("Workflow '" + name_ +
                             "': cannot add components after Execute");
    }
    component->owner_id_ = id_;
    component->limiter_ = std::move(options.limiter);
    components_.push_back(std::move(component));
    return components_.back().get();
  }

  template <typename Input, typename Handler>
  ComponentT* AddComponent(std::string name, Input input, Handler handler,
                           ComponentOptions options = {}) {
    return AddComponent(
        MakeComponent(std::move(name), std::move(input), std::move(handler)),
        std::move(options));
  }

  // Runs the graph once. Blocks until every component is terminal, or until
  // ctx is cancelled and the handlers already running have returned.
  Result Execute(const Context& ctx, Config config, Data* data) {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
      LogMsg(LogLevel::kError,
             "[Workflow] " + name_ + ": Execute called more than once");
      return {data, Status::kFailed,
              std::make_exception_ptr(ConstructionError(
                  "workflow '" + name_ + "' has already been executed"))};
    }
    for (auto& c : components_) {
      c->frozen_.store(true, std::memory_order_release);
    }

    auto t0 = std::chrono::steady_clock::now();
    metrics_.assign(components_.size(), NodeMetric{});
    for (size_t i = 0; i < components_.size(); ++i) {
      metrics_[i].name = components_[i]->Name();
    }

    try {
      if (data == nullptr) {
        throw ConstructionError("workflow '" + name_ +
                                "': result store must not be null");
      }
      BuildGraph();
    } catch (const ConstructionError& e) {
      LogMsg(LogLevel::kError, "[Workflow] " + name_ + ": " + e.what());
      for (auto& m : metrics_) m.state = NodeState::kSkipped;
      return Finish(data, std::current_exception(), t0);
    }

    Tracker tracker(config, data);
    ctx_ = &ctx;
    tracker_ = &tracker;
    {
      std::lock_guard<std::mutex> lock(mu_);
      remaining_ = nodes_.size();
      pending_deps_.resize(nodes_.size());
      states_.assign(nodes_.size(), NodeState::kPending);
      for (size_t i = 0; i < nodes_.size(); ++i) {
        pending_deps_[i] = nodes_[i].indegree;
      }
    }

    {
      auto wakeup = ctx.OnCancel([this] {
        std::lock_guard<std::mutex> lock(mu_);
        done_cv_.notify_all();
      });
      std::unique_lock<std::mutex> lock(mu_);
      if (ctx.IsCancelled()) {
        StopLocked();
      } else {
        for (size_t i = 0; i < nodes_.size(); ++i) {
          if (nodes_[i].indegree == 0) DispatchLocked(i);
        }
      }
      while (remaining_ > 0) {
        if (!stopping_ && ctx.IsCancelled()) {
          StopLocked();
          continue;
        }
        done_cv_.wait(lock);
      }
    }
    JoinWorkers();

    std::exception_ptr error;
    {
      std::lock_guard<std::mutex> lock(mu_);
      for (size_t i = 0; i < nodes_.size(); ++i) metrics_[i].state = states_[i];
      if (stopping_ && limiter_error_) {
        error = limiter_error_;
      } else if (stopping_) {
        error = std::make_exception_ptr(CancellationError(
            "workflow '" + name_ + "' cancelled before all components ran"));
      } else {
        error = first_error_;
      }
    }
    ctx_ = nullptr;
    tracker_ = nullptr;
    return Finish(data, error, t0);
  }

  size_t ComponentCount() const { return components_.size(); }

  // Per-component metrics in registration order; complete after Execute.
  const std::vector<NodeMetric>& Metrics() const { return metrics_; }

  Status FinalStatus() const { return final_status_; }
  std::exception_ptr FinalError() const { return final_error_; }

 private:
  struct Node {
    ComponentT* component = nullptr;
    std::vector<size_t> children;
    size_t indegree = 0;
  };

  const uint64_t id_;
  std::string name_;
  LogFn log_;
  std::vector<std::unique_ptr<ComponentT>> components_;
  std::vector<Node> nodes_;
  std::vector<NodeMetric> metrics_;
  std::atomic<bool> started_{false};

  // Scheduler state, guarded by mu_
  std::mutex mu_;
  std::condition_variable done_cv_;
  std::vector<size_t> pending_deps_;
  std::vector<NodeState> states_;
  size_t remaining_ = 0;
  bool stopping_ = false;
  std::exception_ptr first_error_;
  std::exception_ptr limiter_error_;  // a limiter wait cut short by cancel
  std::vector<std::thread> threads_;

  const Context* ctx_ = nullptr;
  Tracker* tracker_ = nullptr;

  Status final_status_ = Status::kFailed;
  std::exception_ptr final_error_;

  void LogMsg(LogLevel level, const std::string& msg) const {
    if (log_) log_(level, msg);
  }

  static int64_t ElapsedUs(std::chrono::steady_clock::time_point from) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now() - from)
        .count();
  }

  // Resolves component pointers to indices. Throws ConstructionError.
  void BuildGraph() {
    std::unordered_map<const ComponentT*, size_t> index;
    nodes_.assign(components_.size(), Node{});
    for (size_t i = 0; i < components_.size(); ++i) {
      index[components_[i].get()] = i;
      nodes_[i].component = components_[i].get();
    }

    size_t edges = 0;
    for (size_t i = 0; i < components_.size(); ++i) {
      for (const auto& edge : components_[i]->deps_) {
        auto it = index.find(edge.target);
        if (it == index.end()) {
          if (edge.owner_id != 0 && edge.owner_id != id_) {
            throw ConstructionError(
                "component '" + components_[i]->Name() +
                "' depends on a component of another workflow");
          }
          throw ConstructionError("component '" + components_[i]->Name() +
                                  "' depends on a component not registered "
                                  "with workflow '" +
                                  name_ + "'");
        }
        nodes_[it->second].children.push_back(i);
        nodes_[i].indegree++;
        ++edges;
      }
    }

    ValidateCycle();
    LogMsg(LogLevel::kInfo, "[Workflow] " + name_ + ": validated " +
                                std::to_string(nodes_.size()) +
                                " components, " + std::to_string(edges) +
                                " edges");
  }

  // Kahn's algorithm cycle detection
  void ValidateCycle() const {
    size_t n = nodes_.size();
    std::vector<size_t> in(n);
    for (size_t i = 0; i < n; ++i) in[i] = nodes_[i].indegree;

    std::queue<size_t> q;
    for (size_t i = 0; i < n; ++i)
      if (in[i] == 0) q.push(i);

    size_t processed = 0;
    while (!q.empty()) {
      size_t cur = q.front();
      q.pop();
      ++processed;
      for (size_t child : nodes_[cur].children)
        if (--in[child] == 0) q.push(child);
    }

    if (processed != n) {
      std::string cycle_nodes;
      for (size_t i = 0; i < n; ++i) {
        if (in[i] > 0) {
          if (!cycle_nodes.empty()) cycle_nodes += ", ";
          cycle_nodes += nodes_[i].component->Name();
        }
      }
      throw ConstructionError("Cycle detected involving components: " +
                              cycle_nodes);
    }
  }

  void DispatchLocked(size_t i) {
    states_[i] = NodeState::kReady;
    try {
      threads_.emplace_back([this, i] { RunNode(i); });
    } catch (const std::system_error& e) {
      LogMsg(LogLevel::kError, "[Workflow] " + name_ +
                                   ": cannot start thread for " +
                                   nodes_[i].component->Name() + ": " +
                                   e.what());
      FailLocked(i, std::current_exception());
    }
  }

  void RunNode(size_t i) {
    ComponentT& comp = *nodes_[i].component;
    NodeMetric& metric = metrics_[i];
    std::exception_ptr error;
    bool ran = false;
    {
      ConcurrencyLimiter::Slot slot;
      auto t_ready = std::chrono::steady_clock::now();
      if (comp.Limiter()) {
        try {
          slot = comp.Limiter()->AcquireSlot(*ctx_);
        } catch (const LimiterAcquireError& e) {
          metric.error = e.what();
          error = std::current_exception();
        }
        metric.wait_us = ElapsedUs(t_ready);
      }

      if (!error && MarkRunning(i)) {
        ran = true;
        LogMsg(LogLevel::kDebug, "[Workflow] Running: " + comp.Name());
        auto t_start = std::chrono::steady_clock::now();
        try {
          comp.invoker_(*ctx_, comp.Input(), *tracker_);
        } catch (...) {
          error = std::make_exception_ptr(
              HandlerError(comp.Name(), std::current_exception()));
        }
        metric.duration_us = ElapsedUs(t_start);
      }
    }  // slot released before the node turns terminal

    std::lock_guard<std::mutex> lock(mu_);
    if (!ran) {
      if (error && !limiter_error_) limiter_error_ = error;
      SkipLocked(i);
    } else if (error) {
      FailLocked(i, error);
    } else {
      SucceedLocked(i);
    }
    done_cv_.notify_all();
  }

  bool MarkRunning(size_t i) {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_ || ctx_->IsCancelled()) return false;
    states_[i] = NodeState::kRunning;
    return true;
  }

  void SucceedLocked(size_t i) {
    states_[i] = NodeState::kSucceeded;
    --remaining_;
    LogMsg(LogLevel::kDebug,
           "[Workflow] Done: " + nodes_[i].component->Name() + " (" +
               std::to_string(metrics_[i].duration_us) + "us)");
    for (size_t child : nodes_[i].children) {
      if (--pending_deps_[child] != 0) continue;
      if (states_[child] != NodeState::kPending) continue;
      if (stopping_ || ctx_->IsCancelled()) {
        if (!stopping_) StopLocked();
      } else {
        DispatchLocked(child);
      }
    }
  }

  void FailLocked(size_t i, std::exception_ptr error) {
    states_[i] = NodeState::kFailed;
    --remaining_;
    metrics_[i].error = DescribeException(error);
    if (!first_error_) first_error_ = error;
    LogMsg(LogLevel::kError, "[Workflow] " + metrics_[i].error);
    size_t skipped = SkipDescendantsLocked(i);
    if (skipped > 0) {
      LogMsg(LogLevel::kWarn, "[Workflow] Skipping " +
                                  std::to_string(skipped) +
                                  " dependents of " +
                                  nodes_[i].component->Name());
    }
  }

  // Dispatched but never ran: execution was cancelled
  void SkipLocked(size_t i) {
    states_[i] = NodeState::kSkipped;
    --remaining_;
    if (!stopping_) StopLocked();
  }

  // Reverse-edge reachability from a failed node
  size_t SkipDescendantsLocked(size_t i) {
    size_t count = 0;
    std::queue<size_t> q;
    q.push(i);
    while (!q.empty()) {
      size_t cur = q.front();
      q.pop();
      for (size_t child : nodes_[cur].children) {
        if (states_[child] != NodeState::kPending) continue;
        states_[child] = NodeState::kSkipped;
        --remaining_;
        ++count;
        q.push(child);
      }
    }
    return count;
  }

  // Cancellation: stop dispatching, drop everything not yet dispatched
  void StopLocked() {
    stopping_ = true;
    size_t skipped = 0;
    for (size_t i = 0; i < states_.size(); ++i) {
      if (states_[i] == NodeState::kPending) {
        states_[i] = NodeState::kSkipped;
        --remaining_;
        ++skipped;
      }
    }
    LogMsg(LogLevel::kWarn, "[Workflow] " + name_ + ": cancelled, skipped " +
                                std::to_string(skipped) + " components");
  }

  void JoinWorkers() {
    std::vector<std::thread> threads;
    {
      std::lock_guard<std::mutex> lock(mu_);
      threads.swap(threads_);
    }
    for (auto& t : threads) {
      if (t.joinable()) t.join();
    }
  }

  Result Finish(Data* data, std::exception_ptr error,
                std::chrono::steady_clock::time_point t0) {
    final_status_ = error ? Status::kFailed : Status::kDone;
    final_error_ = error;

    size_t succeeded = 0, failed = 0, skipped = 0;
    for (const auto& m : metrics_) {
      if (m.state == NodeState::kSucceeded) ++succeeded;
      if (m.state == NodeState::kFailed) ++failed;
      if (m.state == NodeState::kSkipped) ++skipped;
    }
    std::string summary = "[Workflow] " + name_ + " finished: " +
                          StatusName(final_status_) +
                          " (succeeded=" + std::to_string(succeeded) +
                          ", failed=" + std::to_string(failed) +
                          ", skipped=" + std::to_string(skipped) + ") in " +
                          std::to_string(ElapsedUs(t0) / 1000) + "ms";
    if (error) summary += ": " + DescribeException(error);
    LogMsg(error ? LogLevel::kWarn : LogLevel::kInfo, summary);
    return {data, final_status_, error};
  }
};

}  // namespace miniflow
