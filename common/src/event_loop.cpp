#include <csignal>

#include <event2/thread.h>

#include "lb/common/event_loop.h"
#include "lb/common/logger.h"

namespace lb {

static void log_libevent_message(int severity, const char *msg) {
    static const Logger log{"LIBEVENT"};
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
    default:
        errlog(log, "{}", msg);
        break;
    }
}

// libevent must be told about threads once, before any base is created
static void init_libevent() {
    static const int ensure_init [[maybe_unused]] = [] {
        event_set_log_callback(log_libevent_message);
        return evthread_use_pthreads();
    }();
}

EventLoop::EventLoop(bool run_immediately) {
    init_libevent();

    m_base.reset(event_base_new());
    evthread_make_base_notifiable(m_base.get());
    m_tasks_event.reset(event_new(
            m_base.get(), -1, 0,
            [](evutil_socket_t, short, void *arg) {
                ((EventLoop *) arg)->run_tasks();
            },
            this));

    if (run_immediately) {
        start();
    }
}

EventLoop::~EventLoop() {
    stop();
    join();
    m_tasks_event.reset();
    m_base.reset();
}

EventLoopPtr EventLoop::create(bool run_immediately) {
    return EventLoopPtr{new EventLoop(run_immediately)};
}

void EventLoop::start() {
    join();
    m_thread = std::thread([this] {
        run();
    });
}

void EventLoop::submit(std::function<void()> task) {
    {
        std::scoped_lock l(m_tasks.mtx);
        m_tasks.val.emplace_back(std::move(task));
    }
    event_active(m_tasks_event.get(), 0, 0);
}

void EventLoop::stop() {
    event_base_loopexit(m_base.get(), nullptr);
}

void EventLoop::join() {
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

event_base *EventLoop::c_base() {
    return m_base.get();
}

void EventLoop::run() {
    sigset_t sigset, oldset;
    sigemptyset(&sigset);
    sigaddset(&sigset, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &sigset, &oldset);

    event_base_loop(m_base.get(), EVLOOP_NO_EXIT_ON_EMPTY);

    pthread_sigmask(SIG_SETMASK, &oldset, nullptr);

    // Tasks submitted while the loop was exiting
    run_tasks();
}

void EventLoop::run_tasks() {
    std::vector<std::function<void()>> tasks;
    {
        std::scoped_lock l(m_tasks.mtx);
        tasks.swap(m_tasks.val);
    }
    for (auto &task : tasks) {
        task();
    }
}

} // namespace lb
