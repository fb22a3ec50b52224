/**
 * remcp - Injectable blocking sleep used by rate limiting and retry backoff.
 */
#pragma once

#include <chrono>
#include <functional>

namespace remcp
{

    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    void blocking_sleep(std::chrono::milliseconds duration);

} // namespace remcp
