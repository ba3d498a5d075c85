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


#include "gqlengine/public/async_iterator.h"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace gqlengine {

using gqlengine_base::Future;
using gqlengine_base::MakeReadyFuture;
using gqlengine_base::Promise;

Future<AsyncIterator::NextResult> VectorAsyncIterator::Next() {
  absl::MutexLock lock(&mu_);
  if (next_ >= values_.size()) {
    return MakeReadyFuture<NextResult>(std::optional<Value>());
  }
  return MakeReadyFuture<NextResult>(
      std::optional<Value>(values_[next_++]));
}

struct SimplePubSub::Subscriber {
  using NextResult = AsyncIterator::NextResult;

  explicit Subscriber(Transform transform) : transform(std::move(transform)) {}

  // Hands `event` to a waiting reader or buffers it.
  void Push(const Value& event) {
    Value value = transform != nullptr ? transform(event) : event;
    std::optional<Promise<NextResult>> reader;
    {
      absl::MutexLock lock(&mu);
      if (done) return;
      if (pull_queue.empty()) {
        push_queue.push_back(std::move(value));
        return;
      }
      reader = std::move(pull_queue.front());
      pull_queue.pop_front();
    }
    reader->Set(std::optional<Value>(std::move(value)));
  }

  Future<NextResult> Pull() {
    absl::MutexLock lock(&mu);
    if (!push_queue.empty()) {
      Value value = std::move(push_queue.front());
      push_queue.pop_front();
      return MakeReadyFuture<NextResult>(std::optional<Value>(std::move(value)));
    }
    if (done) return MakeReadyFuture<NextResult>(std::optional<Value>());
    pull_queue.emplace_back();
    return pull_queue.back().future();
  }

  // Ends the sequence. Waiting readers see its end.
  void Close() {
    std::deque<Promise<NextResult>> readers;
    {
      absl::MutexLock lock(&mu);
      if (done) return;
      done = true;
      push_queue.clear();
      readers.swap(pull_queue);
    }
    for (const Promise<NextResult>& reader : readers) {
      reader.Set(std::optional<Value>());
    }
  }

  const Transform transform;
  absl::Mutex mu;
  std::deque<Value> push_queue ABSL_GUARDED_BY(mu);
  std::deque<Promise<NextResult>> pull_queue ABSL_GUARDED_BY(mu);
  bool done ABSL_GUARDED_BY(mu) = false;
};

struct SimplePubSub::Registry {
  mutable absl::Mutex mu;
  absl::flat_hash_set<std::shared_ptr<Subscriber>> subscribers
      ABSL_GUARDED_BY(mu);
};

namespace {

class PubSubIterator : public AsyncIterator {
 public:
  PubSubIterator(std::shared_ptr<SimplePubSub::Registry> registry,
                 std::shared_ptr<SimplePubSub::Subscriber> subscriber)
      : registry_(std::move(registry)), subscriber_(std::move(subscriber)) {}
  ~PubSubIterator() override { Unsubscribe(); }

  Future<NextResult> Next() override { return subscriber_->Pull(); }
  bool has_return() const override { return true; }
  Future<absl::Status> Return() override {
    Unsubscribe();
    return MakeReadyFuture(absl::OkStatus());
  }

 private:
  void Unsubscribe() {
    {
      absl::MutexLock lock(&registry_->mu);
      registry_->subscribers.erase(subscriber_);
    }
    subscriber_->Close();
  }

  std::shared_ptr<SimplePubSub::Registry> registry_;
  std::shared_ptr<SimplePubSub::Subscriber> subscriber_;
};

}  // namespace

SimplePubSub::SimplePubSub() : registry_(std::make_shared<Registry>()) {}

SimplePubSub::~SimplePubSub() {
  std::vector<std::shared_ptr<Subscriber>> subscribers;
  {
    absl::MutexLock lock(&registry_->mu);
    subscribers.assign(registry_->subscribers.begin(),
                       registry_->subscribers.end());
    registry_->subscribers.clear();
  }
  for (const std::shared_ptr<Subscriber>& subscriber : subscribers) {
    subscriber->Close();
  }
}

bool SimplePubSub::Emit(const Value& event) {
  std::vector<std::shared_ptr<Subscriber>> subscribers;
  {
    absl::MutexLock lock(&registry_->mu);
    subscribers.assign(registry_->subscribers.begin(),
                       registry_->subscribers.end());
  }
  for (const std::shared_ptr<Subscriber>& subscriber : subscribers) {
    subscriber->Push(event);
  }
  return !subscribers.empty();
}

std::shared_ptr<AsyncIterator> SimplePubSub::Subscribe(Transform transform) {
  auto subscriber = std::make_shared<Subscriber>(std::move(transform));
  {
    absl::MutexLock lock(&registry_->mu);
    registry_->subscribers.insert(subscriber);
  }
  return std::make_shared<PubSubIterator>(registry_, std::move(subscriber));
}

size_t SimplePubSub::subscriber_count() const {
  absl::MutexLock lock(&registry_->mu);
  return registry_->subscribers.size();
}

}  // namespace gqlengine
