#pragma once

#include <dlfcn.h>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <deque>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace splicenet::test {

// Resolver for RTLD_NEXT symbols, so that overrides can forward to the real libc implementation.
// Aborts if symbol resolution fails.
template <typename Fn>
Fn ResolveNext(const char* name) {
  void* sym = dlsym(RTLD_NEXT, name);
  if (sym == nullptr) {
    std::abort();
  }
  return reinterpret_cast<Fn>(sym);
}

template <typename Action>
class ActionQueue {
 public:
  ActionQueue() = default;
  ActionQueue(const ActionQueue&) = delete;
  ActionQueue& operator=(const ActionQueue&) = delete;

  void reset() {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.clear();
  }

  void setActions(std::initializer_list<Action> actions) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.assign(actions.begin(), actions.end());
  }

  void push(Action action) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _actions.emplace_back(std::move(action));
  }

  [[nodiscard]] std::optional<Action> pop() {
    std::scoped_lock<std::mutex> lock(_mutex);
    if (_actions.empty()) {
      return std::nullopt;
    }
    Action front = std::move(_actions.front());
    _actions.pop_front();
    return front;
  }

 private:
  std::mutex _mutex;
  std::deque<Action> _actions;
};

template <typename Key, typename Action, typename Hash = std::hash<Key>, typename Eq = std::equal_to<Key>>
class KeyedActionQueue {
 public:
  KeyedActionQueue() = default;
  KeyedActionQueue(const KeyedActionQueue&) = delete;
  KeyedActionQueue& operator=(const KeyedActionQueue&) = delete;

  void reset() {
    std::scoped_lock<std::mutex> lock(_mutex);
    _queues.clear();
  }

  void setActions(const Key& key, std::initializer_list<Action> actions) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _queues[key] = std::deque<Action>(actions.begin(), actions.end());
  }

  void setActions(const Key& key, std::vector<Action> actions) {
    std::scoped_lock<std::mutex> lock(_mutex);
    auto& queue = _queues[key];
    queue.clear();
    for (auto& action : actions) {
      queue.emplace_back(std::move(action));
    }
  }

  void push(const Key& key, Action action) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _queues[key].emplace_back(std::move(action));
  }

  [[nodiscard]] std::optional<Action> pop(const Key& key) {
    std::scoped_lock<std::mutex> lock(_mutex);
    auto it = _queues.find(key);
    if (it == _queues.end() || it->second.empty()) {
      return std::nullopt;
    }
    Action front = std::move(it->second.front());
    it->second.pop_front();
    if (it->second.empty()) {
      _queues.erase(it);
    }
    return front;
  }

 private:
  std::mutex _mutex;
  std::unordered_map<Key, std::deque<Action>, Hash, Eq> _queues;
};

template <typename Queue>
class QueueResetGuard {
 public:
  explicit QueueResetGuard(Queue& queue) noexcept : _queue(queue) {}
  QueueResetGuard(const QueueResetGuard&) = delete;
  QueueResetGuard& operator=(const QueueResetGuard&) = delete;
  ~QueueResetGuard() { _queue.reset(); }

 private:
  Queue& _queue;
};

}  // namespace splicenet::test

// Syscall action: first = return value (-1 for error), second = errno to set when returning -1.
using SyscallAction = std::pair<int, int>;

// IO action: first = byte count cap (or -1 for error), second = errno to set when returning -1.
using IoAction = std::pair<ssize_t, int>;

namespace splicenet::test {

// splice(2) actions, keyed either by the input descriptor or by the output descriptor.
// An error action makes splice fail without touching the descriptors.
// A non-negative action caps the length passed to the real splice, to simulate short transfers.
inline KeyedActionQueue<int, IoAction> g_splice_in_actions;
inline KeyedActionQueue<int, IoAction> g_splice_out_actions;

// pipe2(2) actions: (-1, errno) makes the next pipe creation fail.
inline ActionQueue<SyscallAction> g_pipe2_actions;

inline void ResetSpliceActions() {
  g_splice_in_actions.reset();
  g_splice_out_actions.reset();
  g_pipe2_actions.reset();
}

using SpliceFn = ssize_t (*)(int, loff_t*, int, loff_t*, size_t, unsigned int);
using Pipe2Fn = int (*)(int*, int);

inline SpliceFn ResolveRealSplice() {
  static SpliceFn fn = ResolveNext<SpliceFn>("splice");
  return fn;
}

inline Pipe2Fn ResolveRealPipe2() {
  static Pipe2Fn fn = ResolveNext<Pipe2Fn>("pipe2");
  return fn;
}

}  // namespace splicenet::test

#ifdef SPLICENET_WANT_SPLICE_OVERRIDES
extern "C" ssize_t splice(int fdIn, loff_t* offIn, int fdOut, loff_t* offOut, size_t len, unsigned int flags) {
  auto action = splicenet::test::g_splice_in_actions.pop(fdIn);
  if (!action) {
    action = splicenet::test::g_splice_out_actions.pop(fdOut);
  }
  if (action) {
    if (action->first < 0) {
      errno = action->second;
      return -1;
    }
    len = std::min(len, static_cast<size_t>(action->first));
  }
  return splicenet::test::ResolveRealSplice()(fdIn, offIn, fdOut, offOut, len, flags);
}
#endif

#ifdef SPLICENET_WANT_PIPE_OVERRIDES
extern "C" int pipe2(int* pipefd, int flags) noexcept {
  if (auto action = splicenet::test::g_pipe2_actions.pop()) {
    if (action->first < 0) {
      errno = action->second;
      return -1;
    }
  }
  return splicenet::test::ResolveRealPipe2()(pipefd, flags);
}
#endif
