#include "judge/CommandJudge.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/Errors.hpp"
#include "judge/JudgePrompt.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

extern char **environ;

namespace PromptGuard
{
    namespace Judge
    {
        namespace
        {
            /// Owns one file descriptor.
            class UniqueFd
            {
            public:
                UniqueFd() = default;
                explicit UniqueFd(int fd) noexcept : m_fd(fd) {}

                UniqueFd(const UniqueFd &)            = delete;
                UniqueFd &operator=(const UniqueFd &) = delete;

                ~UniqueFd() { reset(); }

                int get() const noexcept { return m_fd; }
                bool valid() const noexcept { return m_fd >= 0; }

                void reset() noexcept
                {
                    if (m_fd >= 0)
                    {
                        ::close(m_fd);
                        m_fd = -1;
                    }
                }

            private:
                int m_fd = -1;
            };

            void ignoreSigpipeOnce()
            {
                // A judge that exits without reading stdin must not kill the gateway.
                static std::once_flag flag;
                std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
            }

            void setNonBlocking(int fd)
            {
                const int flags = ::fcntl(fd, F_GETFL, 0);
                if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
                    throw core::JudgeUnavailable(std::string("fcntl failed: ") + std::strerror(errno));
            }

            std::vector<std::string> buildEnvironment(double anomalyScore)
            {
                const std::string prefix = std::string(CommandJudge::kScoreEnvVar) + "=";

                std::vector<std::string> env;
                for (char **e = environ; e != nullptr && *e != nullptr; ++e)
                {
                    if (!Utils::startsWith(*e, prefix))
                        env.emplace_back(*e);
                }

                std::ostringstream oss;
                oss << prefix << std::setprecision(17) << anomalyScore;
                env.push_back(oss.str());
                return env;
            }

            void killAndReap(pid_t pid)
            {
                ::kill(pid, SIGKILL);
                int status = 0;
                while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
                {
                }
            }
        } // namespace

        CommandJudge::CommandJudge(std::string command, std::chrono::milliseconds timeout)
            : m_command(std::move(command)),
              m_timeout(timeout)
        {
            if (Utils::trim(m_command).empty())
                throw std::invalid_argument("judge command must not be empty");
            if (m_timeout.count() <= 0)
                throw std::invalid_argument("judge timeout must be positive");

            ignoreSigpipeOnce();
        }

        core::JudgeVerdict CommandJudge::judge(const std::string &promptText, double anomalyScore)
        {
            Utils::Stopwatch sw;

            const std::string reply = run(JudgePrompt::build(promptText, anomalyScore), anomalyScore);
            Utils::getLogger().debug("Judge raw reply: " + Utils::previewForLog(reply, 200));

            const core::JudgeVerdict verdict = JudgePrompt::parseReply(reply);
            return verdict.withLatency(sw.elapsedMillis());
        }

        std::string CommandJudge::run(const std::string &input, double anomalyScore) const
        {
            // Prepared before fork(): the child may only call async-signal-safe functions.
            const std::vector<std::string> envStrings = buildEnvironment(anomalyScore);
            std::vector<char *> envp;
            envp.reserve(envStrings.size() + 1);
            for (const auto &s : envStrings)
                envp.push_back(const_cast<char *>(s.c_str()));
            envp.push_back(nullptr);

            const char *argv[] = {"/bin/sh", "-c", m_command.c_str(), nullptr};

            int inPipe[2];
            int outPipe[2];
            if (::pipe2(inPipe, O_CLOEXEC) != 0)
                throw core::JudgeUnavailable(std::string("pipe failed: ") + std::strerror(errno));
            UniqueFd childIn(inPipe[0]);
            UniqueFd toChild(inPipe[1]);

            if (::pipe2(outPipe, O_CLOEXEC) != 0)
                throw core::JudgeUnavailable(std::string("pipe failed: ") + std::strerror(errno));
            UniqueFd fromChild(outPipe[0]);
            UniqueFd childOut(outPipe[1]);

            const pid_t pid = ::fork();
            if (pid < 0)
                throw core::JudgeUnavailable(std::string("fork failed: ") + std::strerror(errno));

            if (pid == 0)
            {
                ::dup2(childIn.get(), STDIN_FILENO);
                ::dup2(childOut.get(), STDOUT_FILENO);
                ::execve("/bin/sh", const_cast<char *const *>(argv), envp.data());
                ::_exit(127);
            }

            childIn.reset();
            childOut.reset();

            try
            {
                setNonBlocking(toChild.get());
                setNonBlocking(fromChild.get());
            }
            catch (const core::JudgeUnavailable &)
            {
                killAndReap(pid);
                throw;
            }

            const auto deadline = Utils::SteadyClock::now() + m_timeout;
            const auto remainingMs = [&deadline]() -> int {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - Utils::SteadyClock::now());
                return left.count() > 0 ? static_cast<int>(left.count()) : 0;
            };

            std::string output;
            std::size_t written = 0;
            if (input.empty())
                toChild.reset();

            while (fromChild.valid())
            {
                const int waitMs = remainingMs();
                if (waitMs == 0)
                {
                    killAndReap(pid);
                    throw core::JudgeUnavailable("judge command timed out after " +
                                                 std::to_string(m_timeout.count()) + " ms");
                }

                pollfd fds[2];
                nfds_t count = 0;
                fds[count++] = pollfd{fromChild.get(), POLLIN, 0};
                if (toChild.valid())
                    fds[count++] = pollfd{toChild.get(), POLLOUT, 0};

                const int rc = ::poll(fds, count, waitMs);
                if (rc < 0)
                {
                    if (errno == EINTR)
                        continue;
                    const std::string err = std::strerror(errno);
                    killAndReap(pid);
                    throw core::JudgeUnavailable("poll failed: " + err);
                }
                if (rc == 0)
                    continue;

                if (count > 1 && fds[1].revents != 0)
                {
                    const ssize_t n = ::write(toChild.get(), input.data() + written, input.size() - written);
                    if (n > 0)
                    {
                        written += static_cast<std::size_t>(n);
                        if (written == input.size())
                            toChild.reset();
                    }
                    else if (n < 0 && errno != EAGAIN && errno != EINTR)
                    {
                        // EPIPE: the child stopped reading; its answer still counts.
                        toChild.reset();
                    }
                }

                if (fds[0].revents != 0)
                {
                    char buf[4096];
                    const ssize_t n = ::read(fromChild.get(), buf, sizeof(buf));
                    if (n > 0)
                    {
                        output.append(buf, static_cast<std::size_t>(n));
                        if (output.size() > kMaxReplyBytes)
                        {
                            killAndReap(pid);
                            throw core::JudgeUnavailable("judge reply exceeds " +
                                                         std::to_string(kMaxReplyBytes) + " bytes");
                        }
                    }
                    else if (n == 0)
                    {
                        fromChild.reset();
                    }
                    else if (errno != EAGAIN && errno != EINTR)
                    {
                        const std::string err = std::strerror(errno);
                        killAndReap(pid);
                        throw core::JudgeUnavailable("read failed: " + err);
                    }
                }
            }
            toChild.reset();

            // stdout is closed; give the child the rest of the budget to exit.
            int status = 0;
            for (;;)
            {
                const pid_t r = ::waitpid(pid, &status, WNOHANG);
                if (r == pid)
                    break;
                if (r < 0 && errno != EINTR)
                    throw core::JudgeUnavailable(std::string("waitpid failed: ") + std::strerror(errno));
                if (remainingMs() == 0)
                {
                    killAndReap(pid);
                    throw core::JudgeUnavailable("judge command timed out after " +
                                                 std::to_string(m_timeout.count()) + " ms");
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }

            if (!WIFEXITED(status))
                throw core::JudgeUnavailable("judge command terminated by a signal");
            if (WEXITSTATUS(status) != 0)
                throw core::JudgeUnavailable("judge command exited with status " +
                                             std::to_string(WEXITSTATUS(status)));
            return output;
        }

    } // namespace Judge
} // namespace PromptGuard
