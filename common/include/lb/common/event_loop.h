#pragma once

#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include <event2/event.h>

#include "lb/common/defs.h"

namespace lb {

class EventLoop;
using EventLoopPtr = std::unique_ptr<EventLoop>;

/**
 * Event loop class. Uses libevent.
 */
class EventLoop {
public:
    /**
     * @param run_immediately if true the loop will be `start`ed immediately
     * @return New event loop
     */
    static EventLoopPtr create(bool run_immediately = true);

    ~EventLoop();

    /**
     * Run event loop in a separate thread
     */
    void start();

    /**
     * Submit a task to be executed on the event loop
     */
    void submit(std::function<void()> task);

    /**
     * Stop event loop
     */
    void stop();

    /**
     * Join event loop thread
     */
    void join();

    /**
     * @return Libevent base
     */
    event_base *c_base();

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;
    EventLoop(EventLoop &&) = delete;
    EventLoop &operator=(EventLoop &&) = delete;

private:
    UniquePtr<event_base, &event_base_free> m_base;
    /** Activated to run the submitted tasks on the loop thread */
    UniquePtr<event, &event_free> m_tasks_event;
    std::thread m_thread;
    WithMtx<std::vector<std::function<void()>>> m_tasks;

    explicit EventLoop(bool run_immediately);

    void run();
    void run_tasks();
};

} // namespace lb
