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


#ifndef GQLENGINE_PUBLIC_ASYNC_ITERATOR_H_
#define GQLENGINE_PUBLIC_ASYNC_ITERATOR_H_

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "gqlengine/base/future.h"
#include "gqlengine/public/value.h"

namespace gqlengine {

// An asynchronous sequence of values. Resolvers return one (wrapped in
// Value::Iterator) for streamed list fields and for subscription event
// streams.
//
// Next() is never called again before the previously returned future is
// ready.
class AsyncIterator {
 public:
  // The next value, nullopt once the sequence is exhausted, or an error.
  using NextResult = absl::StatusOr<std::optional<Value>>;

  virtual ~AsyncIterator() = default;

  virtual gqlengine_base::Future<NextResult> Next() = 0;

  // Whether the iterator can be closed early. Streams over such iterators
  // are cancelled when the consumer stops reading the response.
  virtual bool has_return() const { return false; }

  // Closes the iterator early, releasing its resources. Only called when
  // has_return() is true.
  virtual gqlengine_base::Future<absl::Status> Return() {
    return gqlengine_base::MakeReadyFuture(absl::OkStatus());
  }
};

// Yields the values of a vector, each one immediately available.
class VectorAsyncIterator : public AsyncIterator {
 public:
  explicit VectorAsyncIterator(std::vector<Value> values)
      : values_(std::move(values)) {}

  gqlengine_base::Future<NextResult> Next() override;

 private:
  absl::Mutex mu_;
  std::vector<Value> values_;
  size_t next_ ABSL_GUARDED_BY(mu_) = 0;
};

// Delegates to functions, which makes it easy to build iterators in tests
// and adapters.
class CallbackAsyncIterator : public AsyncIterator {
 public:
  using NextFn = std::function<gqlengine_base::Future<NextResult>()>;
  using ReturnFn = std::function<gqlengine_base::Future<absl::Status>()>;

  // `on_return` may be null, in which case the iterator cannot be closed
  // early.
  explicit CallbackAsyncIterator(NextFn next, ReturnFn on_return = nullptr)
      : next_(std::move(next)), on_return_(std::move(on_return)) {}

  gqlengine_base::Future<NextResult> Next() override { return next_(); }
  bool has_return() const override { return on_return_ != nullptr; }
  gqlengine_base::Future<absl::Status> Return() override {
    return on_return_();
  }

 private:
  NextFn next_;
  ReturnFn on_return_;
};

// An in-process event emitter. Each Subscribe() returns an iterator over the
// events emitted after it was created; events that arrive while nobody is
// reading are buffered.
//
//   SimplePubSub pubsub;
//   std::shared_ptr<AsyncIterator> events = pubsub.Subscribe();
//   pubsub.Emit(Value::String("ping"));
//   events->Next();  // ready: "ping"
//
// Thread safe. Iterators may outlive the SimplePubSub.
class SimplePubSub {
 public:
  using Transform = std::function<Value(const Value& event)>;

  SimplePubSub();
  SimplePubSub(const SimplePubSub&) = delete;
  SimplePubSub& operator=(const SimplePubSub&) = delete;
  ~SimplePubSub();

  // Delivers `event` to every subscriber. Returns whether there were any.
  bool Emit(const Value& event);

  // `transform`, if given, is applied to each event before it is yielded.
  std::shared_ptr<AsyncIterator> Subscribe(Transform transform = nullptr);

  size_t subscriber_count() const;

  struct Subscriber;
  struct Registry;

 private:
  std::shared_ptr<Registry> registry_;
};

}  // namespace gqlengine

#endif  // GQLENGINE_PUBLIC_ASYNC_ITERATOR_H_
