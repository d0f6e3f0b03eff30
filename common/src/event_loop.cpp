#include <algorithm>
#include <csignal>
#include <optional>

#include <event2/thread.h>

#include "shroud/common/event_loop.h"
#include "shroud/common/utils.h"

namespace shroud {

static const struct EventLogCallbackSetter {
    EventLogCallbackSetter() noexcept {
        event_set_log_callback([](int severity, const char *msg) {
            static Logger log{"libevent"};
            switch (severity) {
            case EVENT_LOG_DEBUG:
                dbglog(log, "{}", msg);
                break;
            case EVENT_LOG_MSG:
                infolog(log, "{}", msg);
                break;
            case EVENT_LOG_WARN:
                warnlog(log, "{}", msg);
                break;
            case EVENT_LOG_ERR:
                errlog(log, "{}", msg);
                break;
            default:
                tracelog(log, "???: {}", msg);
            }
        });
    }
} set_event_log_cb [[maybe_unused]];

EventLoopPtr EventLoop::create(bool run_immediately) {
    static const int ensure_threads [[maybe_unused]] = evthread_use_pthreads();

    EventLoopPtr loop{new EventLoop()};
    loop->m_base.reset(event_base_new());
    if (loop->m_base == nullptr) {
        errlog(loop->m_log, "Failed to create event base");
        return nullptr;
    }
    evthread_make_base_notifiable(loop->m_base.get());

    if (run_immediately) {
        loop->start();
    }
    return loop;
}

EventLoop::~EventLoop() {
    stop();
    join();
    m_base.reset();
}

void EventLoop::start() {
    join();
    m_base_thread = std::thread([this] {
        run();
    });
}

void EventLoop::run_postponed_task(evutil_socket_t, short, void *arg) {
    auto *task_arg = (PostponedTasks::Task *) arg;
    EventLoop *self = task_arg->loop;

    std::optional<PostponedTasks::Task> task;
    {
        std::scoped_lock l(self->m_postponed_tasks.mtx);
        auto &queue = self->m_postponed_tasks.val.queue;
        auto it = std::find_if(queue.begin(), queue.end(), [task_id = task_arg->id](const PostponedTasks::Task &i) {
            return i.id == task_id;
        });
        if (it != queue.end()) {
            task = std::move(*it);
            queue.erase(it);
        }
    }

    if (task.has_value() && task->func) {
        task->func();
    }
}

void EventLoop::schedule(Micros postpone_time, std::function<void()> task) {
    std::scoped_lock l(m_postponed_tasks.mtx);
    auto &entry = m_postponed_tasks.val.queue.emplace_back(
            PostponedTasks::Task{this, ++m_postponed_tasks.val.task_id_counter, std::move(task)});

    timeval tv = utils::duration_to_timeval(postpone_time);
    if (0 != event_base_once(m_base.get(), -1, EV_TIMEOUT, run_postponed_task, &entry, &tv)) {
        warnlog(m_log, "Failed to schedule a postponed task");
        m_postponed_tasks.val.queue.pop_back();
    }
}

void EventLoop::stop() {
    event_base_loopexit(m_base.get(), nullptr);
}

void EventLoop::join() {
    if (m_base_thread.joinable() && m_base_thread.get_id() != std::this_thread::get_id()) {
        m_base_thread.join();
    }
}

void EventLoop::run() {
    // Block SIGPIPE
    sigset_t sigset, oldset;
    sigemptyset(&sigset);
    sigaddset(&sigset, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &sigset, &oldset);

    event_base_loop(m_base.get(), EVLOOP_NO_EXIT_ON_EMPTY);

    pthread_sigmask(SIG_SETMASK, &oldset, nullptr);
}

} // namespace shroud
