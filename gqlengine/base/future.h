//
// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//


#ifndef GQLENGINE_BASE_FUTURE_H_
#define GQLENGINE_BASE_FUTURE_H_

// A minimal single-assignment future used to express resolvers that complete
// later. A Promise<T> produces exactly one value; every Future<T> obtained
// from it observes that value. Continuations registered with OnReady() or
// Then() run on the thread that fulfills the promise, or immediately if the
// value is already available. Continuations never run under the internal
// lock.
//
//   Promise<int> promise;
//   Future<std::string> text =
//       promise.future().Then([](const int& v) { return absl::StrCat(v); });
//   promise.Set(42);
//   text.value();  // "42"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "gqlengine/base/logging.h"

namespace gqlengine_base {

template <typename T>
class Future;
template <typename T>
class Promise;

namespace future_internal {

template <typename T>
struct SharedState {
  absl::Mutex mu;
  std::optional<T> value ABSL_GUARDED_BY(mu);
  std::vector<std::function<void(const T&)>> callbacks ABSL_GUARDED_BY(mu);
};

template <typename T>
struct IsFuture : std::false_type {};
template <typename T>
struct IsFuture<Future<T>> : std::true_type {};

}  // namespace future_internal

template <typename T>
class Future {
 public:
  using value_type = T;

  // An invalid future. Only assignment and valid() may be used on it.
  Future() = default;

  bool valid() const { return state_ != nullptr; }

  bool is_ready() const {
    absl::MutexLock lock(&state_->mu);
    return state_->value.has_value();
  }

  // REQUIRES: is_ready().
  const T& value() const {
    absl::MutexLock lock(&state_->mu);
    GQLENGINE_CHECK(state_->value.has_value()) << "Future is not ready";
    return *state_->value;
  }

  // Blocks the calling thread until the value is available. Only meaningful
  // when another thread fulfills the promise.
  const T& Wait() const {
    absl::MutexLock lock(&state_->mu);
    state_->mu.Await(absl::Condition(
        +[](std::optional<T>* v) { return v->has_value(); },
        &state_->value));
    return *state_->value;
  }

  // Runs `callback` with the value once it is available.
  void OnReady(std::function<void(const T&)> callback) const {
    {
      absl::MutexLock lock(&state_->mu);
      if (!state_->value.has_value()) {
        state_->callbacks.push_back(std::move(callback));
        return;
      }
    }
    callback(*state_->value);
  }

  // Returns a future for `f(value)`. If `f` itself returns a Future<U>, the
  // result is flattened to Future<U>.
  template <typename F>
  auto Then(F f) const;

 private:
  friend class Promise<T>;

  explicit Future(std::shared_ptr<future_internal::SharedState<T>> state)
      : state_(std::move(state)) {}

  std::shared_ptr<future_internal::SharedState<T>> state_;
};

template <typename T>
class Promise {
 public:
  Promise() : state_(std::make_shared<future_internal::SharedState<T>>()) {}

  Future<T> future() const { return Future<T>(state_); }

  // Fulfills the promise and runs pending continuations. A promise may only
  // be fulfilled once.
  void Set(T value) const {
    std::vector<std::function<void(const T&)>> callbacks;
    {
      absl::MutexLock lock(&state_->mu);
      GQLENGINE_CHECK(!state_->value.has_value())
          << "Promise fulfilled more than once";
      state_->value.emplace(std::move(value));
      callbacks.swap(state_->callbacks);
    }
    // The value is never modified once set, so reading it unlocked is safe.
    for (auto& callback : callbacks) {
      callback(*state_->value);
    }
  }

 private:
  std::shared_ptr<future_internal::SharedState<T>> state_;
};

template <typename T>
Future<T> MakeReadyFuture(T value) {
  Promise<T> promise;
  promise.Set(std::move(value));
  return promise.future();
}

template <typename T>
template <typename F>
auto Future<T>::Then(F f) const {
  using R = std::invoke_result_t<F&, const T&>;
  if constexpr (future_internal::IsFuture<R>::value) {
    using U = typename R::value_type;
    Promise<U> promise;
    OnReady([promise, f](const T& v) mutable {
      f(v).OnReady([promise](const U& u) { promise.Set(u); });
    });
    return promise.future();
  } else {
    Promise<R> promise;
    OnReady([promise, f](const T& v) mutable { promise.Set(f(v)); });
    return promise.future();
  }
}

// Returns a future for the values of all `futures`, in their original order.
template <typename T>
Future<std::vector<T>> CollectAll(std::vector<Future<T>> futures) {
  if (futures.empty()) {
    return MakeReadyFuture(std::vector<T>());
  }
  struct State {
    absl::Mutex mu;
    std::vector<std::optional<T>> results ABSL_GUARDED_BY(mu);
    size_t remaining ABSL_GUARDED_BY(mu);
    Promise<std::vector<T>> promise;
  };
  auto state = std::make_shared<State>();
  {
    absl::MutexLock lock(&state->mu);
    state->results.resize(futures.size());
    state->remaining = futures.size();
  }
  Future<std::vector<T>> result = state->promise.future();
  for (size_t i = 0; i < futures.size(); ++i) {
    futures[i].OnReady([state, i](const T& v) {
      std::vector<T> collected;
      {
        absl::MutexLock lock(&state->mu);
        state->results[i].emplace(v);
        if (--state->remaining != 0) return;
        collected.reserve(state->results.size());
        for (std::optional<T>& r : state->results) {
          collected.push_back(std::move(*r));
        }
      }
      state->promise.Set(std::move(collected));
    });
  }
  return result;
}

}  // namespace gqlengine_base

#endif  // GQLENGINE_BASE_FUTURE_H_
