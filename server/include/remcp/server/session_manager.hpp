#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>

namespace remcp::server
{

    class Session;

    // Tracks sessions whose worker thread is still running so that shutdown
    // can interrupt them and wait for the workers to drain.
    class SessionManager
    {
    public:
        void add(const std::shared_ptr<Session> &session);
        void remove(const Session *session);

        void stop_all();
        void wait_idle();

    private:
        std::mutex mutex_;
        std::condition_variable idle_;
        std::map<const Session *, std::weak_ptr<Session>> sessions_;
    };

} // namespace remcp::server
