#pragma once

#include <algorithm>
#include <cassert>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#define FWD(x) std::forward<decltype(x)>(x)

#ifndef RILL_DEFAULT_LOG_LEVEL
#define RILL_DEFAULT_LOG_LEVEL off
#endif

namespace rill {

enum class log_level_t {
  trace,
  debug,
  info,
  warn,
  error,
  off,
};

inline auto to_string(const log_level_t level) -> std::string_view {
  switch (level) {
  default:
    return "unknown";
  case log_level_t::trace:
    return "trace";
  case log_level_t::debug:
    return "debug";
  case log_level_t::info:
    return "info";
  case log_level_t::warn:
    return "warn";
  case log_level_t::error:
    return "error";
  case log_level_t::off:
    return "off";
  }
}

using log_sink_t = std::function<void(log_level_t, std::string_view)>;

namespace detail {
inline auto log_threshold = log_level_t::RILL_DEFAULT_LOG_LEVEL;
inline auto log_sink = log_sink_t{};
} // namespace detail

inline auto log_level() { return detail::log_threshold; }
inline void set_log_level(const log_level_t level) {
  detail::log_threshold = level;
}

/// Installs the function receiving every emitted log line.
/// An empty sink restores the default, which prints to stderr.
inline void set_log_sink(log_sink_t sink) { detail::log_sink = std::move(sink); }

template <typename... Args>
void log(const log_level_t level, fmt::format_string<Args...> format,
         Args &&...args) {
  if (level == log_level_t::off or level < detail::log_threshold)
    return;

  const auto message = fmt::format(format, FWD(args)...);
  if (detail::log_sink) {
    detail::log_sink(level, message);
    return;
  }

  fmt::print(stderr, "[rill:{}] {}\n", to_string(level), message);
}

struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Thrown when a computed reads itself before it ever produced a value.
struct cycle_error : error {
  using error::error;
};

/// "Same value" equality: NaN equals NaN and +0 differs from -0,
/// everything else compares with operator==.
struct same_value_t {
  template <typename T, typename U>
  auto operator()(const T &lhs, const U &rhs) const -> bool {
    if constexpr (std::floating_point<T> and std::floating_point<U>) {
      if (std::isnan(lhs) or std::isnan(rhs))
        return std::isnan(lhs) and std::isnan(rhs);

      return lhs == rhs and std::signbit(lhs) == std::signbit(rhs);
    } else {
      return lhs == rhs;
    }
  }
};

inline constexpr auto same_value = same_value_t{};

/// std::hash consistent with same_value_t: every NaN hashes alike.
struct same_value_hash {
  template <typename T> auto operator()(const T &value) const -> std::size_t {
    if constexpr (std::floating_point<T>) {
      if (std::isnan(value))
        return std::hash<T>{}(std::numeric_limits<T>::quiet_NaN());
    }
    return std::hash<T>{}(value);
  }
};

struct hooks_mixin {
  mutable int track_counter = 0;
  mutable int recompute_counter = 0;
  mutable int mark_dirty_counter = 0;
  mutable int notify_counter = 0;

  void before_track() const { ++track_counter; }
  void before_recompute() const { ++recompute_counter; }
  void before_mark_dirty() const { ++mark_dirty_counter; }
  void on_notify() const { ++notify_counter; }
};

template <typename T, typename Hash = std::hash<T>>
class insertion_order_set {
  std::vector<T> nodes;
  std::unordered_set<T, Hash> index;

public:
  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  auto begin() const { return nodes.begin(); }
  auto end() const { return nodes.end(); }
  auto contains(const T &value) const { return index.contains(value); }

  auto insert(const T &value) {
    if (not index.insert(value).second)
      return false;

    nodes.push_back(value);
    return true;
  }

  /// Empties the set, handing back its elements in insertion order.
  auto take() {
    index.clear();
    return std::exchange(nodes, {});
  }
};

template <typename F> struct scope_guard {
  F f;
  ~scope_guard() { f(); };
};

struct reactive_t;
struct computed_base;

using subscriber_t = std::function<void()>;
using subscriber_ptr = std::shared_ptr<const subscriber_t>;
using unsubscribe_t = std::function<void()>;
using disposer_t = std::function<void()>;
using scope_manager_t = std::vector<disposer_t>;
using track_fn_t = std::function<void(const std::shared_ptr<reactive_t> &)>;

/// Marks a node that has not been re-tracked during the current recompute.
inline constexpr auto unused_version = std::int64_t{-1};

/// One edge of the dependency graph. Every node is linked into exactly two
/// lists at once: the target list of its source and the source list of its
/// target.
struct node_t {
  reactive_t *source = nullptr;
  computed_base *target = nullptr;
  std::int64_t version = 0;

  node_t *prev_source = nullptr;
  node_t *next_source = nullptr;
  node_t *prev_target = nullptr;
  node_t *next_target = nullptr;

  // Value of source->node before this node took it over.
  node_t *rollback = nullptr;
};

namespace detail {

struct context_t {
  // The computed whose function is currently running, if any.
  computed_base *current = nullptr;

  std::size_t batch_depth = 0;
  insertion_order_set<subscriber_ptr> pending;

  std::vector<computed_base *> eval_stack;
  const track_fn_t *hook = nullptr;
  std::vector<scope_manager_t *> scopes;
};

inline auto context() -> context_t & {
  thread_local auto ctx = context_t{};
  return ctx;
}

inline thread_local auto live_node_count = std::size_t{0};

} // namespace detail

/// Number of graph edges alive on the current thread.
inline auto live_nodes() { return detail::live_node_count; }

inline auto is_batching() { return detail::context().batch_depth != 0; }

struct reactive_t : hooks_mixin, std::enable_shared_from_this<reactive_t> {
  std::int64_t version = 0;
  node_t *targets = nullptr;

  // Fast re-tracking cache: the node linking this reactive to the
  // computed that is currently running.
  node_t *node = nullptr;

  std::vector<subscriber_ptr> subscribers;

  reactive_t() = default;
  reactive_t(const reactive_t &) = delete;
  reactive_t &operator=(const reactive_t &) = delete;
  virtual ~reactive_t();

  virtual computed_base *as_computed() { return nullptr; }

  // Called when the last node leaves the target list.
  virtual void on_unobserved() {}

  void track();
  void notify();
  auto subscribe(subscriber_ptr subscriber) -> unsubscribe_t;

  auto subscribe(subscriber_t subscriber) -> unsubscribe_t {
    return subscribe(std::make_shared<const subscriber_t>(std::move(subscriber)));
  }

  auto targets_count() const {
    auto count = std::size_t{0};
    for (auto *n = targets; n != nullptr; n = n->next_target)
      ++count;
    return count;
  }

  auto has_target(const computed_base *target) const {
    for (auto *n = targets; n != nullptr; n = n->next_target)
      if (n->target == target)
        return true;
    return false;
  }
};

struct computed_base : reactive_t {
  node_t *sources = nullptr;
  bool dirty = true;
  bool computing = false;
  bool disposed = false;

  // The last recompute threw, so the cached value predates the current
  // sources.
  bool failed = false;

  ~computed_base() override;

  computed_base *as_computed() override { return this; }

  /// Runs the compute function and stores its result.
  /// Returns whether the stored value changed.
  virtual bool evaluate() = 0;

  /// Drops the compute function.
  virtual void release() = 0;

  virtual bool has_selectors() const = 0;

  /// Dirties the selector slots of the previous and the current value.
  virtual void after_change() = 0;

  void recompute();
  void refresh();
  void mark_dirty();
  void dispose();

  auto make_notifier() -> subscriber_ptr;

  auto sources_count() const {
    auto count = std::size_t{0};
    for (auto *n = sources; n != nullptr; n = n->next_source)
      ++count;
    return count;
  }

private:
  auto dirty_source() const -> computed_base *;
  void release_sources();
  void finish_sources(bool succeeded);
};

namespace detail {

inline auto make_node(reactive_t *source, computed_base *target,
                      node_t *rollback) {
  ++live_node_count;
  return new node_t{
      .source = source,
      .target = target,
      .version = source->version,
      .rollback = rollback,
  };
}

inline void destroy_node(node_t *node) {
  assert(live_node_count > 0);
  --live_node_count;
  delete node;
}

// Removes the node from the target list of its source.
inline void unlink_from_source(node_t *node, bool notify_empty = true) {
  auto *source = node->source;
  if (node->prev_target != nullptr)
    node->prev_target->next_target = node->next_target;
  else
    source->targets = node->next_target;

  if (node->next_target != nullptr)
    node->next_target->prev_target = node->prev_target;

  node->prev_target = nullptr;
  node->next_target = nullptr;

  // May destroy the source (selector slots erase themselves).
  if (notify_empty and source->targets == nullptr)
    source->on_unobserved();
}

// Removes the node from the source list of its target.
inline void unlink_from_target(node_t *node) {
  auto *target = node->target;
  if (node->prev_source != nullptr)
    node->prev_source->next_source = node->next_source;
  else
    target->sources = node->next_source;

  if (node->next_source != nullptr)
    node->next_source->prev_source = node->prev_source;

  node->prev_source = nullptr;
  node->next_source = nullptr;
}

// Work collected while marking the graph after a write.
struct schedule_t {
  std::vector<subscriber_ptr> notifications;

  // Marked computeds owning selector slots. They are recomputed right after
  // marking, batch or not, so their slot dependents are dirtied in time.
  std::vector<std::weak_ptr<reactive_t>> selector_owners;
};

inline auto needs_marking(const computed_base *c) {
  return not c->dirty or c->failed;
}

/// Breadth-first dirty propagation starting at root. Nothing is recomputed
/// here: the work for subscribed computeds and selector owners is appended
/// to schedule and run by the caller once every reachable node is marked.
inline void propagate(computed_base *root, schedule_t &schedule) {
  if (not needs_marking(root))
    return;

  auto queue = std::vector<computed_base *>{root};
  for (auto i = std::size_t{0}; i < queue.size(); ++i) {
    auto *c = queue[i];
    if (not needs_marking(c))
      continue;

    c->before_mark_dirty();
    c->dirty = true;
    c->failed = false;

    for (auto *n = c->targets; n != nullptr; n = n->next_target)
      if (needs_marking(n->target))
        queue.push_back(n->target);

    if (c->disposed)
      continue;

    if (not c->subscribers.empty())
      schedule.notifications.push_back(c->make_notifier());
    if (c->has_selectors())
      schedule.selector_owners.push_back(c->weak_from_this());
  }

  log(log_level_t::trace, "mark_dirty {} reached {} computed(s)",
      fmt::ptr(root), queue.size());
}

inline auto describe(const std::exception_ptr &failure) -> std::string {
  try {
    std::rethrow_exception(failure);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

// Called from a catch block: keeps the first failure for the caller and
// logs the later ones.
inline void collect(std::exception_ptr &failure) {
  if (not failure) {
    failure = std::current_exception();
    return;
  }

  log(log_level_t::error, "callback failed: {}",
      describe(std::current_exception()));
}

// Runs every callback once, even when some of them throw.
inline auto drain(const std::vector<subscriber_ptr> &callbacks)
    -> std::exception_ptr {
  auto failure = std::exception_ptr{};
  for (auto &callback : callbacks) {
    try {
      (*callback)();
    } catch (...) {
      collect(failure);
    }
  }

  return failure;
}

/// Recomputes the selector owners, then runs the notifications, or queues
/// them when batching. Every step runs; the first failure is returned.
inline auto dispatch(const schedule_t &schedule) -> std::exception_ptr {
  auto failure = std::exception_ptr{};
  for (auto &weak : schedule.selector_owners) {
    const auto owner = std::static_pointer_cast<computed_base>(weak.lock());
    if (not owner or owner->disposed)
      continue;

    try {
      owner->refresh();
    } catch (...) {
      collect(failure);
    }
  }

  auto &ctx = context();
  if (ctx.batch_depth != 0) {
    for (auto &notification : schedule.notifications)
      ctx.pending.insert(notification);
    return failure;
  }

  for (auto &notification : schedule.notifications) {
    try {
      (*notification)();
    } catch (...) {
      collect(failure);
    }
  }

  return failure;
}

inline void enter_batch() {
  auto &ctx = context();
  ++ctx.batch_depth;
}

inline auto leave_batch() -> std::exception_ptr {
  auto &ctx = context();
  assert(ctx.batch_depth > 0);
  if (--ctx.batch_depth != 0)
    return {};

  const auto callbacks = ctx.pending.take();
  log(log_level_t::trace, "flushing batch of {} callback(s)",
      callbacks.size());
  return drain(callbacks);
}

inline void finish_batch() {
  if (auto failure = leave_batch())
    std::rethrow_exception(failure);
}

// Leaves the batch while an exception from its body is in flight.
inline void abandon_batch() {
  if (auto failure = leave_batch())
    log(log_level_t::error, "batched callback failed while unwinding: {}",
        describe(failure));
}

inline void run_subscribers(const std::vector<subscriber_ptr> &subscribers) {
  auto &ctx = context();
  auto _ = scope_guard{
      [&ctx, previous = std::exchange(ctx.current, nullptr)] {
        ctx.current = previous;
      }};

  // Indexed loop: subscribers added while notifying run in this pass.
  auto failure = std::exception_ptr{};
  for (auto i = std::size_t{0}; i < subscribers.size(); ++i) {
    auto subscriber = subscribers[i];
    try {
      (*subscriber)();
    } catch (...) {
      collect(failure);
    }
  }

  if (failure)
    std::rethrow_exception(failure);
}

inline void observe(reactive_t &source) {
  if (const auto *hook = context().hook)
    (*hook)(source.shared_from_this());
}

inline void register_disposer(disposer_t disposer) {
  auto &scopes = context().scopes;
  if (not scopes.empty())
    scopes.back()->push_back(std::move(disposer));
}

} // namespace detail

inline reactive_t::~reactive_t() {
  for (auto *n = targets; n != nullptr;) {
    auto *next = n->next_target;
    detail::unlink_from_target(n);
    detail::destroy_node(n);
    n = next;
  }
  targets = nullptr;
}

/// Records this reactive as a source of the computed that is currently
/// running.
inline void reactive_t::track() {
  auto *context = detail::context().current;
  if (context == nullptr or context->disposed or context == this)
    return;

  before_track();

  // Re-tracking: the node was marked unused during prepare, revive it and
  // move it to the head of the source list.
  if (node != nullptr and node->target == context) {
    if (node->version != unused_version)
      return;

    node->version = version;
    if (node->prev_source != nullptr) {
      detail::unlink_from_target(node);
      node->next_source = context->sources;
      context->sources->prev_source = node;
      context->sources = node;
    }
    return;
  }

  auto *created = detail::make_node(this, context, node);

  created->next_source = context->sources;
  if (context->sources != nullptr)
    context->sources->prev_source = created;
  context->sources = created;

  created->next_target = targets;
  if (targets != nullptr)
    targets->prev_target = created;
  targets = created;

  node = created;
}

inline void reactive_t::notify() {
  on_notify();
  if (subscribers.empty())
    return;

  auto &ctx = detail::context();
  if (ctx.batch_depth != 0) {
    for (auto &subscriber : subscribers)
      ctx.pending.insert(subscriber);
    return;
  }

  // A subscriber may drop the last handle to this reactive.
  const auto self = weak_from_this().lock();
  detail::run_subscribers(subscribers);
}

inline auto reactive_t::subscribe(subscriber_ptr subscriber) -> unsubscribe_t {
  subscribers.push_back(subscriber);

  return [weak = weak_from_this(), subscriber = std::move(subscriber)] {
    const auto self = weak.lock();
    if (not self)
      return;

    auto &subscribers = self->subscribers;
    const auto it = std::ranges::find(subscribers, subscriber);
    if (it == subscribers.end())
      return;

    // Swap with the last one and pop, the order of the others is not kept.
    std::swap(*it, subscribers.back());
    subscribers.pop_back();
  };
}

inline computed_base::~computed_base() { release_sources(); }

inline auto computed_base::dirty_source() const -> computed_base * {
  for (auto *n = sources; n != nullptr; n = n->next_source) {
    auto *c = n->source->as_computed();
    if (c != nullptr and c->dirty and not c->computing and not c->disposed)
      return c;
  }
  return nullptr;
}

inline void computed_base::release_sources() {
  for (auto *n = sources; n != nullptr;) {
    auto *next = n->next_source;
    detail::unlink_from_source(n);
    detail::destroy_node(n);
    n = next;
  }
  sources = nullptr;
}

// Cleanup phase of recompute.
inline void computed_base::finish_sources(const bool succeeded) {
  for (auto *n = sources; n != nullptr;) {
    auto *next = n->next_source;
    n->source->node = std::exchange(n->rollback, nullptr);

    if (n->version != unused_version and not disposed) {
      n = next;
      continue;
    }

    // A failed evaluation keeps the edges it did not get to.
    if (succeeded or disposed) {
      detail::unlink_from_target(n);
      detail::unlink_from_source(n);
      detail::destroy_node(n);
    } else {
      n->version = n->source->version;
    }
    n = next;
  }
}

inline void computed_base::recompute() {
  if (computing or disposed)
    return;

  before_recompute();
  computing = true;

  // Prepare: every current source is presumed unused until tracked again.
  for (auto *n = sources; n != nullptr; n = n->next_source) {
    n->rollback = n->source->node;
    n->source->node = n;
    n->version = unused_version;
  }

  auto changed = false;
  auto succeeded = false;
  {
    auto &ctx = detail::context();
    auto _ = scope_guard{
        [&, previous = std::exchange(ctx.current, this)] {
          ctx.current = previous;
          finish_sources(succeeded);
          if (disposed)
            release();
          failed = not succeeded;
          computing = false;
        }};

    changed = evaluate();
    succeeded = true;
  }

  if (changed or version == 0)
    ++version;
  dirty = false;

  log(log_level_t::trace, "recompute {} changed={} version={}",
      fmt::ptr(this), changed, version);

  if (changed)
    after_change();
}

/// Brings this computed up to date, recomputing every stale computed it
/// depends on first. Iterative so that long chains cannot exhaust the stack.
inline void computed_base::refresh() {
  auto &stack = detail::context().eval_stack;
  const auto base = stack.size();
  auto _ = scope_guard{[&stack, base] { stack.resize(base); }};

  auto *current = this;
  while (current != nullptr) {
    if (current->dirty and not current->computing and not current->disposed) {
      if (auto *source = current->dirty_source()) {
        stack.push_back(current);
        current = source;
        continue;
      }
      current->recompute();
    }

    if (stack.size() > base) {
      current = stack.back();
      stack.pop_back();
    } else {
      current = nullptr;
    }
  }
}

inline void computed_base::mark_dirty() {
  auto schedule = detail::schedule_t{};
  detail::propagate(this, schedule);
  if (auto failure = detail::dispatch(schedule))
    std::rethrow_exception(failure);
}

inline auto computed_base::make_notifier() -> subscriber_ptr {
  return std::make_shared<const subscriber_t>(
      [weak = weak_from_this(), seen = version] {
        const auto self =
            std::static_pointer_cast<computed_base>(weak.lock());
        if (not self or self->disposed)
          return;

        self->refresh();
        if (self->version != seen)
          detail::run_subscribers(self->subscribers);
      });
}

inline void computed_base::dispose() {
  subscribers.clear();
  if (disposed)
    return;

  disposed = true;
  log(log_level_t::trace, "dispose {}", fmt::ptr(this));

  // Disposed from inside its own function: the cleanup phase of the running
  // recompute unlinks everything.
  if (computing)
    return;

  release_sources();
  release();
}

template <typename T> struct selector_index_base {
  virtual ~selector_index_base() = default;

  /// Dirties the dependents of the slot for key, if there is one.
  virtual void mark(const T &key, detail::schedule_t &schedule) = 0;
  virtual std::size_t size() const = 0;
};

/// Per-key slots for is(key). A slot is a reactive of its own whose targets
/// are the computeds asking whether the owner currently equals that key.
template <typename T> class selector_index final : public selector_index_base<T> {
  struct slot_t final : reactive_t {
    selector_index &owner;
    T key;

    slot_t(selector_index &owner, T key) : owner{owner}, key{std::move(key)} {}

    // Destroys this slot.
    void on_unobserved() override {
      const auto erased = key;
      owner.erase(erased);
    }
  };

  std::unordered_map<T, std::unique_ptr<slot_t>, same_value_hash,
                     same_value_t>
      slots;

public:
  auto slot(const T &key) -> reactive_t & {
    auto [it, inserted] = slots.try_emplace(key);
    if (inserted) {
      it->second = std::make_unique<slot_t>(*this, key);
      log(log_level_t::trace, "selector slot {} created ({} live)",
          fmt::ptr(it->second.get()), slots.size());
    }
    return *it->second;
  }

  void mark(const T &key, detail::schedule_t &schedule) override {
    const auto it = slots.find(key);
    if (it == slots.end())
      return;

    for (auto *n = it->second->targets; n != nullptr; n = n->next_target)
      detail::propagate(n->target, schedule);
  }

  std::size_t size() const override { return slots.size(); }

  // Reached from recompute cleanup, which must not throw: no logging here.
  void erase(const T &key) { slots.erase(key); }
};

namespace detail {

// Tracks the slot for key in the running computed, creating the index and
// the slot on first use.
template <typename T>
void track_selector(std::unique_ptr<selector_index_base<T>> &selectors,
                    const T &key) {
  const auto *context = detail::context().current;
  if (context == nullptr or context->disposed)
    return;

  if (not selectors)
    selectors = std::make_unique<selector_index<T>>();

  static_cast<selector_index<T> &>(*selectors).slot(key).track();
}

} // namespace detail

template <typename T, typename Equal = same_value_t>
struct signal_state final : reactive_t {
  T value;
  [[no_unique_address]] Equal equal;
  std::unique_ptr<selector_index_base<T>> selectors;

  signal_state()
    requires std::default_initializable<T>
  = default;

  explicit signal_state(std::in_place_t, auto &&...args)
      : value(FWD(args)...) {}

  void assign(auto &&next) {
    if (equal(value, next))
      return;

    auto previous = std::exchange(value, FWD(next));
    ++version;
    log(log_level_t::trace, "set {} version={}", fmt::ptr(this), version);

    // Mark first, run afterwards: a computed reached through both a selector
    // slot and a direct edge must be notified once.
    auto schedule = detail::schedule_t{};
    if (selectors) {
      selectors->mark(previous, schedule);
      selectors->mark(value, schedule);
    }
    for (auto *n = targets; n != nullptr; n = n->next_target)
      detail::propagate(n->target, schedule);

    // The write is committed: our own subscribers hear about it even when a
    // dependent failed.
    auto failure = detail::dispatch(schedule);
    try {
      notify();
    } catch (...) {
      detail::collect(failure);
    }

    if (failure)
      std::rethrow_exception(failure);
  }
};

template <typename T, typename Equal = same_value_t> class signal {
public:
  using value_type = T;
  using state_t = signal_state<T, Equal>;

  std::shared_ptr<state_t> state;

  signal()
    requires std::default_initializable<T>
      : state{std::make_shared<state_t>()} {}

  signal(const signal &) = default;
  signal(signal &&) = default;

  signal(std::in_place_t, auto &&...args)
      : state{std::make_shared<state_t>(std::in_place, FWD(args)...)} {}

  // Allows both of:
  // auto a = signal{42};
  // signal<std::optional<int>> b = 42;
  explicit(false) signal(std::convertible_to<T> auto value)
    requires(not std::same_as<decltype(value), signal>)
      : signal{std::in_place, std::move(value)} {}

  auto set(auto &&value) const {
    // Setting may run subscribers that drop this handle.
    const auto keep = state;
    keep->assign(FWD(value));
  }

  auto update(std::invocable<const T &> auto &&f) const {
    set(FWD(f)(state->value));
  }

  auto &operator=(auto &&value)
    requires(not std::same_as<std::remove_cvref_t<decltype(value)>, signal>)
  {
    set(FWD(value));
    return *this;
  }

  // Assigning handles would silently rewire dependents.
  signal &operator=(const signal &) = delete;
  signal &operator=(signal &&) = delete;

  /// Returns the current value, registering this signal as a dependency of
  /// the running computed.
  auto value() const -> const T & {
    state->track();
    detail::observe(*state);
    return state->value;
  }

  auto operator()() const -> const T & { return value(); }
  operator const T &() const { return value(); }

  /// Returns the current value without registering a dependency.
  auto peek() const -> const T & { return state->value; }

  auto is(const T &key) const {
    detail::track_selector(state->selectors, key);
    return same_value(state->value, key);
  }

  auto subscribe(subscriber_t subscriber) const {
    return state->subscribe(std::move(subscriber));
  }

  auto subscribe(subscriber_ptr subscriber) const {
    return state->subscribe(std::move(subscriber));
  }
};

template <typename T> signal(T) -> signal<T>;

template <typename T> auto make_signal(auto &&...args) {
  return signal<T>{std::in_place, FWD(args)...};
}

/// A view of a signal that can be read and observed but not written.
template <typename T, typename Equal = same_value_t> class readonly_signal {
  signal<T, Equal> source;

public:
  using value_type = T;

  explicit readonly_signal(signal<T, Equal> source)
      : source{std::move(source)} {}

  auto value() const -> const T & { return source.value(); }
  auto operator()() const -> const T & { return source.value(); }
  auto peek() const -> const T & { return source.peek(); }
  auto is(const T &key) const { return source.is(key); }

  auto subscribe(auto subscriber) const {
    return source.subscribe(std::move(subscriber));
  }
};

template <typename T, typename Equal>
auto readonly(signal<T, Equal> source) {
  return readonly_signal<T, Equal>{std::move(source)};
}

template <typename T> struct computed_state final : computed_base {
  std::function<T()> fn;
  std::optional<T> cached;

  // The value replaced by the last change, kept only while selector slots
  // are being dirtied.
  std::optional<T> previous;
  std::unique_ptr<selector_index_base<T>> selectors;

  explicit computed_state(std::function<T()> fn) : fn{std::move(fn)} {}

  bool evaluate() override {
    auto next = fn();
    if (cached and same_value(*cached, next))
      return false;

    if (has_selectors() and cached)
      previous.emplace(std::move(*cached));
    cached.emplace(std::move(next));
    return true;
  }

  void release() override { fn = nullptr; }

  bool has_selectors() const override {
    return selectors and selectors->size() != 0;
  }

  void after_change() override {
    if (not has_selectors())
      return;

    auto schedule = detail::schedule_t{};
    if (previous)
      selectors->mark(*std::exchange(previous, std::nullopt), schedule);
    selectors->mark(*cached, schedule);
    if (auto failure = detail::dispatch(schedule))
      std::rethrow_exception(failure);
  }
};

template <typename T> class computed {
public:
  using value_type = T;
  using state_t = computed_state<T>;

  std::shared_ptr<state_t> state;

  computed(const computed &) = default;
  computed &operator=(const computed &) = default;

  computed(computed &&) = default;
  computed &operator=(computed &&) = default;

  template <typename F>
    requires(not std::same_as<std::remove_cvref_t<F>, computed>) and
            std::invocable<F &> and
            std::convertible_to<std::invoke_result_t<F &>, T>
  explicit(false) computed(F f)
      : state{std::make_shared<state_t>(std::function<T()>{std::move(f)})} {
    state->recompute();

    detail::register_disposer([weak = std::weak_ptr{state}] {
      if (auto p = weak.lock())
        p->dispose();
    });
  }

  /// Returns the cached value, recomputing it first when it is stale.
  /// Inside another computed, this computed becomes one of its sources.
  auto value() const -> const T & {
    auto &s = *state;
    s.track();
    detail::observe(s);

    if (s.dirty)
      s.refresh();

    // Only reachable when the first evaluation reads itself.
    if (not s.cached)
      throw cycle_error{"computed read during its own first evaluation"};

    return *s.cached;
  }

  auto operator()() const -> const T & { return value(); }
  operator const T &() const { return value(); }

  auto is(const T &key) const {
    auto &s = *state;
    if (s.dirty)
      s.refresh();

    detail::track_selector(s.selectors, key);
    return s.cached and same_value(*s.cached, key);
  }

  auto subscribe(subscriber_t subscriber) const {
    return state->subscribe(std::move(subscriber));
  }

  auto subscribe(subscriber_ptr subscriber) const {
    return state->subscribe(std::move(subscriber));
  }

  void dispose() const { state->dispose(); }
  auto disposed() const { return state->disposed; }
};

template <typename F>
computed(F) -> computed<std::remove_cvref_t<std::invoke_result_t<F &>>>;

template <typename T> auto make_computed(auto f) {
  return computed<T>{std::move(f)};
}

/// Runs f, deferring every subscriber notification until the outermost
/// batch returns. Each deferred callback runs once.
template <std::invocable F> decltype(auto) batch(F &&f) {
  detail::enter_batch();

  if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
    try {
      FWD(f)();
    } catch (...) {
      detail::abandon_batch();
      throw;
    }
    detail::finish_batch();
  } else {
    auto result = [&]() -> std::invoke_result_t<F> {
      try {
        return FWD(f)();
      } catch (...) {
        detail::abandon_batch();
        throw;
      }
    }();
    detail::finish_batch();
    return result;
  }
}

/// Runs f without a tracking context: nothing read inside becomes a
/// dependency.
decltype(auto) untracked(std::invocable auto &&f) {
  auto &ctx = detail::context();
  auto _ = scope_guard{[&ctx, previous = std::exchange(ctx.current, nullptr)] {
    ctx.current = previous;
  }};
  return FWD(f)();
}

/// Observes every signal or computed whose value is read while this object
/// is alive. Hooks nest; the previous one is restored on destruction.
class tracking_hook {
  track_fn_t fn;
  const track_fn_t *previous;

public:
  explicit tracking_hook(track_fn_t fn)
      : fn{std::move(fn)},
        previous{std::exchange(detail::context().hook, &this->fn)} {}

  tracking_hook(const tracking_hook &) = delete;
  tracking_hook &operator=(const tracking_hook &) = delete;

  ~tracking_hook() { detail::context().hook = previous; }
};

/// The result of capture(): the value plus every reactive it read.
template <typename T> class captured {
  std::vector<unsubscribe_t> unsubscribers;

public:
  T value;
  std::vector<std::shared_ptr<reactive_t>> sources;

  captured(T value, std::vector<std::shared_ptr<reactive_t>> sources)
      : value{std::move(value)}, sources{std::move(sources)} {}

  auto subscribed() const { return not unsubscribers.empty(); }

  /// Subscribes callback to every captured source. Only the first call
  /// has an effect until unsubscribe().
  void subscribe(subscriber_t callback) {
    if (subscribed())
      return;

    const auto shared = std::make_shared<const subscriber_t>(std::move(callback));
    for (auto &source : sources)
      unsubscribers.push_back(source->subscribe(shared));
  }

  void unsubscribe() {
    for (auto &unsubscribe : std::exchange(unsubscribers, {}))
      unsubscribe();
  }
};

template <std::invocable F> auto capture(F &&f) {
  auto sources = insertion_order_set<std::shared_ptr<reactive_t>>{};
  auto hook = tracking_hook{[&](const std::shared_ptr<reactive_t> &source) {
    sources.insert(source);
  }};

  if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
    FWD(f)();
    return captured<std::monostate>{{}, sources.take()};
  } else {
    auto value = FWD(f)();
    return captured<decltype(value)>{std::move(value), sources.take()};
  }
}

/// Runs f while collecting the disposers of every computed and effect it
/// creates. Returns the result together with a disposer for all of them.
template <std::invocable F> auto scope(F &&f) {
  auto manager = std::make_shared<scope_manager_t>();

  auto dispose = disposer_t{[manager] {
    auto disposers = std::exchange(*manager, {});
    for (auto it = disposers.rbegin(); it != disposers.rend(); ++it)
      (*it)();
  }};

  auto &scopes = detail::context().scopes;
  scopes.push_back(manager.get());
  auto _ = scope_guard{[&scopes] { scopes.pop_back(); }};

  if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
    FWD(f)();
    return dispose;
  } else {
    auto result = FWD(f)();
    return std::pair{std::move(result), std::move(dispose)};
  }
}

/// Runs f now and again whenever something it read changes. f may return a
/// cleanup function, called before each rerun and on disposal.
[[nodiscard]] auto effect(std::invocable auto f) -> disposer_t {
  auto cleanup = std::make_shared<disposer_t>();

  auto c = computed<int>{[f = std::move(f), cleanup] {
    if (*cleanup)
      untracked(std::exchange(*cleanup, nullptr));

    if constexpr (std::is_void_v<std::invoke_result_t<decltype(f) &>>)
      f();
    else
      *cleanup = disposer_t{f()};
    return 0;
  }};

  // Subscribed computeds are re-evaluated eagerly.
  auto unsubscribe = c.subscribe([] {});

  auto dispose = disposer_t{[c, unsubscribe, cleanup] {
    unsubscribe();
    c.dispose();
    if (*cleanup)
      untracked(std::exchange(*cleanup, nullptr));
  }};

  detail::register_disposer(dispose);
  return dispose;
}

template <typename> constexpr auto is_reactive_v = false;

template <typename T, typename Equal>
constexpr auto is_reactive_v<signal<T, Equal>> = true;

template <typename T, typename Equal>
constexpr auto is_reactive_v<readonly_signal<T, Equal>> = true;

template <typename T> constexpr auto is_reactive_v<computed<T>> = true;

template <typename T>
concept reactive = is_reactive_v<std::remove_cvref_t<T>>;

enum class kind_t {
  plain,
  signal,
  computed,
};

/// Either a plain value, a signal or a computed, decided once at
/// construction. Plain functions are wrapped into a computed.
template <typename T> class maybe_reactive {
  std::variant<T, signal<T>, computed<T>> holder;

public:
  using value_type = T;

  explicit(false) maybe_reactive(T value)
      : holder{std::in_place_index<0>, std::move(value)} {}

  explicit(false) maybe_reactive(signal<T> source)
      : holder{std::in_place_index<1>, std::move(source)} {}

  explicit(false) maybe_reactive(computed<T> source)
      : holder{std::in_place_index<2>, std::move(source)} {}

  template <typename F>
    requires(not reactive<F>) and std::invocable<F &> and
            std::convertible_to<std::invoke_result_t<F &>, T>
  explicit(false) maybe_reactive(F f)
      : holder{std::in_place_index<2>, computed<T>{std::move(f)}} {}

  auto kind() const { return static_cast<kind_t>(holder.index()); }
  auto is_reactive() const { return kind() != kind_t::plain; }

  /// Reads the value, tracking it when it is reactive.
  auto get() const -> const T & {
    switch (kind()) {
    default:
    case kind_t::plain:
      return std::get<0>(holder);
    case kind_t::signal:
      return std::get<1>(holder).value();
    case kind_t::computed:
      return std::get<2>(holder).value();
    }
  }

  auto subscribe(subscriber_t subscriber) const -> unsubscribe_t {
    switch (kind()) {
    default:
    case kind_t::plain:
      return [] {};
    case kind_t::signal:
      return std::get<1>(holder).subscribe(std::move(subscriber));
    case kind_t::computed:
      return std::get<2>(holder).subscribe(std::move(subscriber));
    }
  }
};

} // namespace rill

template <typename T, typename Equal>
struct fmt::formatter<rill::signal<T, Equal>> : fmt::formatter<T> {
  auto format(const rill::signal<T, Equal> &s, auto &ctx) const {
    return fmt::formatter<T>::format(s.peek(), ctx);
  }
};

template <typename T>
struct fmt::formatter<rill::computed<T>> : fmt::formatter<T> {
  auto format(const rill::computed<T> &c, auto &ctx) const {
    return fmt::formatter<T>::format(rill::untracked(c), ctx);
  }
};
