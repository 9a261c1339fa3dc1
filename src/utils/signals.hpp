#pragma once
#include <csignal>
#include <cstdlib>
#include <functional>
#include "logging.hpp"

namespace signals
{

    // Callback run on the first SIGINT/SIGTERM
    inline std::function<void()> &shutdownCallback()
    {
        static std::function<void()> callback;
        return callback;
    }

    inline volatile std::sig_atomic_t &signalCount()
    {
        static volatile std::sig_atomic_t count = 0;
        return count;
    }

    // First signal asks the loop to stop, a second one exits immediately
    inline void signalHandler(int signal)
    {
        signalCount() = signalCount() + 1;
        if (signalCount() > 1)
        {
            std::_Exit(signal);
        }

        if (shutdownCallback())
        {
            shutdownCallback()();
        }
    }

    inline void setupSignalHandlers(std::function<void()> callback)
    {
        shutdownCallback() = callback;
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        log_info("Signal handlers registered for graceful shutdown");
    }

} // namespace signals
