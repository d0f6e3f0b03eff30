#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <thread>

#include <event2/event.h>

#include "shroud/common/defs.h"
#include "shroud/common/logger.h"

namespace shroud {

class EventLoop;
using EventLoopPtr = std::unique_ptr<EventLoop>;

/**
 * Event loop running in its own thread. Uses libevent.
 * Postponed tasks are executed sequentially on the loop thread.
 */
class EventLoop {
public:
    /**
     * @param run_immediately if true the loop will be `start`ed immediately
     * @return New event loop, or nullptr if the libevent base could not be created
     */
    static EventLoopPtr create(bool run_immediately = true);

    ~EventLoop();

    /**
     * Run event loop
     */
    void start();

    class TaskId {
    private:
        uint64_t m_value = 0;

    public:
        friend bool operator==(const TaskId &l, const TaskId &r) {
            return l.m_value == r.m_value;
        }
        TaskId &operator++() {
            ++m_value;
            return *this;
        }
    };

    /**
     * Schedule a `task` to be executed on the event loop after the `postpone_time`
     */
    void schedule(Micros postpone_time, std::function<void()> task);

    /**
     * Stop event loop
     */
    void stop();

    /**
     * Join event loop thread
     */
    void join();

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;
    EventLoop(EventLoop &&) = delete;
    EventLoop &operator=(EventLoop &&) = delete;

private:
    Logger m_log{"event_loop"};
    /** Libevent base */
    UniquePtr<event_base, &event_base_free> m_base;
    /** Thread where base loop is running */
    std::thread m_base_thread;

    struct PostponedTasks {
        struct Task {
            EventLoop *loop;
            TaskId id;
            std::function<void()> func;
        };

        TaskId task_id_counter;
        std::list<Task> queue;
    };
    /** Postponed tasks */
    WithMtx<PostponedTasks> m_postponed_tasks;

    EventLoop() = default;

    /** Code for running base loop in thread */
    void run();

    static void run_postponed_task(evutil_socket_t, short, void *arg);
};

} // namespace shroud
