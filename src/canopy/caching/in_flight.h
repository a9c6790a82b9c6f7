#ifndef CANOPY_CACHING_IN_FLIGHT_H
#define CANOPY_CACHING_IN_FLIGHT_H

#include <mutex>
#include <unordered_map>
#include <utility>

#include <cppcoro/shared_task.hpp>

#include <canopy/core/type_definitions.hpp>

// The in-flight registry is what guarantees that concurrent requests for the
// same key only trigger a single fetch.
//
// Each entry maps a key to the shared task that's producing its value. The
// first request for a key creates the task (which is lazy, so it starts when
// that request awaits it), and any requests that arrive while it's running
// simply await the same task. When the task finishes (successfully or not),
// it removes its own entry, so the next request starts a fresh fetch.
// Failures are therefore never remembered.
//
// The registry itself isn't synchronized. It must be protected by the same
// mutex as the cache that owns it, and that mutex must never be held while
// awaiting a task.

namespace canopy {

template<class Key, class Value, class Hash = std::hash<Key>>
struct in_flight_registry : noncopyable
{
    typedef cppcoro::shared_task<Value> task_type;

    // Get the task that's producing the value for :key, creating it with
    // :create_task if there isn't one.
    //
    // The second member of the result indicates whether or not the task was
    // created by this call.
    //
    template<class CreateTask>
    std::pair<task_type, bool>
    join_or_start(Key const& key, CreateTask&& create_task)
    {
        auto existing = tasks_.find(key);
        if (existing != tasks_.end())
            return std::make_pair(existing->second, false);
        task_type task = std::forward<CreateTask>(create_task)();
        tasks_.emplace(key, task);
        return std::make_pair(std::move(task), true);
    }

    bool
    contains(Key const& key) const
    {
        return tasks_.find(key) != tasks_.end();
    }

    bool
    remove(Key const& key)
    {
        return tasks_.erase(key) != 0;
    }

    size_t
    size() const
    {
        return tasks_.size();
    }

    // A removal_guard removes a key from the registry when it goes out of
    // scope. Tasks created for the registry hold one of these in their body,
    // so their entries are gone before any of their waiters resume.
    struct removal_guard : noncopyable
    {
        removal_guard(in_flight_registry& registry, std::mutex& mutex, Key key)
            : registry_(registry), mutex_(mutex), key_(std::move(key))
        {
        }
        ~removal_guard()
        {
            std::scoped_lock<std::mutex> lock(mutex_);
            registry_.remove(key_);
        }

     private:
        in_flight_registry& registry_;
        std::mutex& mutex_;
        Key key_;
    };

 private:
    std::unordered_map<Key, task_type, Hash> tasks_;
};

} // namespace canopy

#endif
