/*
 * Lifecycle listeners - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace tasksup {

class SupervisedTask; // forward decl

enum class LifecycleEvent { Starting, WorkRunning, WorkSucceeded, WorkFailed, Stopping };

const char* to_string(LifecycleEvent ev);

// Observer of one or more supervised tasks. Every hook defaults to a no-op.
class TaskListener {
public:
    virtual ~TaskListener() = default;
    virtual void on_starting(const SupervisedTask&) {}
    virtual void on_work_running(const SupervisedTask&) {}
    virtual void on_work_succeeded(const SupervisedTask&) {}
    virtual void on_work_failed(const SupervisedTask&) {}
    virtual void before_stopping(const SupervisedTask&) {}
};

// Owned by whoever constructs supervisors; shared by all tasks it is handed to.
class ListenerRegistry {
public:
    void add_listener(std::shared_ptr<TaskListener> listener);
    void clear();
    std::size_t size() const;
    // Copy taken under the lock so delivery does not hold it.
    std::vector<std::shared_ptr<TaskListener>> snapshot() const;
private:
    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<TaskListener>> m_listeners;
};

// Delivers events in registration order. A listener throwing is logged and skipped.
class ListenerBridge {
public:
    explicit ListenerBridge(ListenerRegistry& registry) : m_registry(registry) {}
    void notify(LifecycleEvent ev, const SupervisedTask& task) const;
private:
    ListenerRegistry& m_registry;
};

// Starting on construction, Stopping exactly once on close() or destruction.
class LifecycleScope {
public:
    LifecycleScope(const ListenerBridge& bridge, const SupervisedTask& task);
    ~LifecycleScope();
    LifecycleScope(const LifecycleScope&) = delete;
    LifecycleScope& operator=(const LifecycleScope&) = delete;

    void close();
    bool closed() const { return m_closed.load(); }
private:
    const ListenerBridge& m_bridge;
    const SupervisedTask& m_task;
    std::once_flag m_once;
    std::atomic<bool> m_closed{false};
};

} // namespace tasksup
