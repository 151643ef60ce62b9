#pragma once

#include <atomic>

namespace pixoogate
{
    namespace runtime
    {

        // SIGINT/SIGTERM only set a flag; the runtime loop polls it
        class SignalHandler
        {
        public:
            static void install();
            static bool is_shutdown_requested();

        private:
            static void handle_signal(int signal);
            static std::atomic<bool> shutdown_requested_;
        };

    } // namespace runtime
} // namespace pixoogate
