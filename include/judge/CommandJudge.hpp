#pragma once

#include <chrono>
#include <string>

#include "judge/Judge.hpp"

namespace PromptGuard
{
    namespace Judge
    {
        /**
         * CommandJudge
         *
         * Judge binding backed by an external program, typically a small
         * script that forwards the request to a hosted language model.
         *
         *  - The command runs as `/bin/sh -c <command>`.
         *  - The full judge prompt (JudgePrompt::build) is written to stdin.
         *  - PROMPTGUARD_ANOMALY_SCORE carries the anomaly score.
         *  - stdout is parsed with JudgePrompt::parseReply.
         *
         * Non-zero exit, a timeout (the child is killed) or an unparseable
         * reply raise core::JudgeUnavailable. Safe to call concurrently;
         * each call spawns its own child.
         *
         * Process-wide side effect: the first CommandJudge constructed sets
         * SIGPIPE to SIG_IGN, so a judge that exits without reading its stdin
         * turns the write into EPIPE instead of killing the host process.
         * A host with its own SIGPIPE handler installs it after constructing
         * the judge.
         */
        class CommandJudge : public IJudge
        {
        public:
            static constexpr const char *kScoreEnvVar = "PROMPTGUARD_ANOMALY_SCORE";

            /// Upper bound on captured stdout; larger replies are rejected.
            static constexpr std::size_t kMaxReplyBytes = 1U << 20;

            CommandJudge(std::string command, std::chrono::milliseconds timeout);

            core::JudgeVerdict judge(const std::string &promptText, double anomalyScore) override;

            const std::string &command() const noexcept { return m_command; }
            std::chrono::milliseconds timeout() const noexcept { return m_timeout; }

        private:
            /// Run the command with `input` on stdin; returns captured stdout.
            std::string run(const std::string &input, double anomalyScore) const;

        private:
            std::string               m_command;
            std::chrono::milliseconds m_timeout;
        };

    } // namespace Judge
} // namespace PromptGuard
