#include "remcp/timing.hpp"

#include <thread>

namespace remcp
{

    void blocking_sleep(std::chrono::milliseconds duration)
    {
        if (duration.count() > 0)
        {
            std::this_thread::sleep_for(duration);
        }
    }

} // namespace remcp
