#include "SystemPingProber.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <thread>

extern char **environ;

namespace net_watch::probe
{
    namespace
    {
        bool IsSafeAddress(const std::string &address)
        {
            if (address.empty() || address.front() == '-')
                return false;
            return std::all_of(address.begin(), address.end(), [](unsigned char c)
                               { return std::isalnum(c) || c == '.' || c == ':' || c == '-' || c == '%' || c == '_'; });
        }

        class SpawnActions
        {
        public:
            SpawnActions() { m_ok = posix_spawn_file_actions_init(&m_actions) == 0; }
            ~SpawnActions()
            {
                if (m_ok)
                    posix_spawn_file_actions_destroy(&m_actions);
            }
            SpawnActions(const SpawnActions &) = delete;
            SpawnActions &operator=(const SpawnActions &) = delete;

            bool DiscardOutput()
            {
                return m_ok &&
                       posix_spawn_file_actions_addopen(&m_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0) == 0 &&
                       posix_spawn_file_actions_addopen(&m_actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0) == 0;
            }

            posix_spawn_file_actions_t *Get() { return &m_actions; }

        private:
            posix_spawn_file_actions_t m_actions;
            bool m_ok = false;
        };
    }

    PlatformFamily CurrentPlatform()
    {
#if defined(_WIN32)
        return PlatformFamily::Windows;
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
        return PlatformFamily::Bsd;
#else
        return PlatformFamily::Linux;
#endif
    }

    std::vector<std::string> BuildPingArguments(PlatformFamily platform,
                                                const std::string &executable,
                                                const std::string &address,
                                                std::chrono::milliseconds timeout)
    {
        long ms = std::max<long>(1, static_cast<long>(timeout.count()));
        switch (platform)
        {
        case PlatformFamily::Windows:
            return {executable, "-n", "1", "-w", std::to_string(ms), address};

        case PlatformFamily::Bsd:
            // -W is the reply wait in milliseconds on macOS/BSD
            return {executable, "-c", "1", "-W", std::to_string(ms), address};

        case PlatformFamily::Linux:
            break;
        }

        // iputils -W takes whole seconds and rejects 0
        long secs = std::max(1L, std::lround(static_cast<double>(ms) / 1000.0));
        return {executable, "-c", "1", "-W", std::to_string(secs), address};
    }

    SystemPingProber::SystemPingProber(PlatformFamily platform, std::string executable, std::chrono::milliseconds grace)
        : m_platform(platform), m_executable(std::move(executable)), m_grace(grace)
    {
    }

    ProbeOutcome SystemPingProber::Probe(const std::string &address, std::chrono::milliseconds timeout)
    {
        if (!IsSafeAddress(address))
        {
            return ProbeOutcome::Down(ProbeStatus::InvalidAddress, "rejected address: " + address);
        }

        std::vector<std::string> args = BuildPingArguments(m_platform, m_executable, address, timeout);
        std::vector<char *> argv;
        argv.reserve(args.size() + 1);
        for (auto &arg : args)
            argv.push_back(arg.data());
        argv.push_back(nullptr);

        SpawnActions actions;
        if (!actions.DiscardOutput())
        {
            return ProbeOutcome::Down(ProbeStatus::ToolError, "posix_spawn_file_actions setup failed");
        }

        pid_t pid = -1;
        int rc = posix_spawnp(&pid, m_executable.c_str(), actions.Get(), nullptr, argv.data(), environ);
        if (rc != 0)
        {
            return ProbeOutcome::Down(ProbeStatus::ToolError, "spawn " + m_executable + ": " + std::strerror(rc));
        }

        auto deadline = std::chrono::steady_clock::now() + timeout + m_grace;
        int status = 0;
        while (true)
        {
            pid_t done = ::waitpid(pid, &status, WNOHANG);
            if (done == pid)
                break;
            if (done < 0 && errno != EINTR)
            {
                return ProbeOutcome::Down(ProbeStatus::ToolError, std::string("waitpid: ") + std::strerror(errno));
            }

            if (std::chrono::steady_clock::now() >= deadline)
            {
                ::kill(pid, SIGKILL);
                while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
                {
                }
                return ProbeOutcome::Down(ProbeStatus::TimedOut, m_executable + " exceeded its deadline");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (WIFEXITED(status) && WEXITSTATUS(status) == 0)
            return ProbeOutcome::Up();

        if (WIFEXITED(status) && WEXITSTATUS(status) == 127)
            return ProbeOutcome::Down(ProbeStatus::ToolError, m_executable + " could not be executed");

        if (WIFSIGNALED(status))
            return ProbeOutcome::Down(ProbeStatus::ToolError, m_executable + " killed by signal " + std::to_string(WTERMSIG(status)));

        return ProbeOutcome::Down(ProbeStatus::Unreachable, m_executable + " exit status " + std::to_string(WEXITSTATUS(status)));
    }
}
