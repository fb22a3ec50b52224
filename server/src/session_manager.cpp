#include "remcp/server/session_manager.hpp"

#include <vector>

#include "remcp/server/session.hpp"

namespace remcp::server
{

    void SessionManager::add(const std::shared_ptr<Session> &session)
    {
        std::lock_guard lock(mutex_);
        sessions_[session.get()] = session;
    }

    void SessionManager::remove(const Session *session)
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(session);
        if (sessions_.empty())
        {
            idle_.notify_all();
        }
    }

    void SessionManager::stop_all()
    {
        std::vector<std::shared_ptr<Session>> live;
        {
            std::lock_guard lock(mutex_);
            live.reserve(sessions_.size());
            for (const auto &[key, weak] : sessions_)
            {
                if (auto session = weak.lock())
                {
                    live.push_back(std::move(session));
                }
            }
        }
        for (const auto &session : live)
        {
            session->stop();
        }
    }

    void SessionManager::wait_idle()
    {
        std::unique_lock lock(mutex_);
        idle_.wait(lock, [this]
                   { return sessions_.empty(); });
    }

} // namespace remcp::server
