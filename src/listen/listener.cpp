/*
 * Lifecycle listeners implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/listen/listener.hpp>
#include <task-supervisor/task/supervised_task.hpp>
#include <task-supervisor/util/log.hpp>
#include <exception>

namespace tasksup {

const char* to_string(LifecycleEvent ev) {
    switch (ev) {
        case LifecycleEvent::Starting: return "starting";
        case LifecycleEvent::WorkRunning: return "work_running";
        case LifecycleEvent::WorkSucceeded: return "work_succeeded";
        case LifecycleEvent::WorkFailed: return "work_failed";
        case LifecycleEvent::Stopping: return "stopping";
    }
    return "?";
}

void ListenerRegistry::add_listener(std::shared_ptr<TaskListener> listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lk(m_mutex);
    m_listeners.push_back(std::move(listener));
}

void ListenerRegistry::clear() {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_listeners.clear();
}

std::size_t ListenerRegistry::size() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_listeners.size();
}

std::vector<std::shared_ptr<TaskListener>> ListenerRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_listeners;
}

static void dispatch(TaskListener& l, LifecycleEvent ev, const SupervisedTask& task) {
    switch (ev) {
        case LifecycleEvent::Starting: l.on_starting(task); break;
        case LifecycleEvent::WorkRunning: l.on_work_running(task); break;
        case LifecycleEvent::WorkSucceeded: l.on_work_succeeded(task); break;
        case LifecycleEvent::WorkFailed: l.on_work_failed(task); break;
        case LifecycleEvent::Stopping: l.before_stopping(task); break;
    }
}

void ListenerBridge::notify(LifecycleEvent ev, const SupervisedTask& task) const {
    for (auto &l : m_registry.snapshot()) {
        try {
            dispatch(*l, ev, task);
        } catch (const std::exception& e) {
            log::error("listener failed on ", to_string(ev), " for task ", task.label(), ": ", e.what());
        } catch (...) {
            log::error("listener failed on ", to_string(ev), " for task ", task.label(), ": unknown exception");
        }
    }
}

LifecycleScope::LifecycleScope(const ListenerBridge& bridge, const SupervisedTask& task)
    : m_bridge(bridge), m_task(task) {
    m_bridge.notify(LifecycleEvent::Starting, m_task);
}

LifecycleScope::~LifecycleScope() { close(); }

void LifecycleScope::close() {
    std::call_once(m_once, [this]{
        m_closed = true;
        m_bridge.notify(LifecycleEvent::Stopping, m_task);
    });
}

} // namespace tasksup
