#include "judge/JudgePrompt.hpp"

#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"

namespace PromptGuard
{
    namespace Judge
    {
        using nlohmann::json;

        namespace
        {
            constexpr const char *kInstruction =
                "You are an intelligent AI firewall. Your primary goal is to distinguish between "
                "MALICIOUS ACTIONS (e.g. hacking, social engineering, destroying data) and "
                "SAFE CONTEXT (e.g. research, storytelling, education). "
                "Critically analyze the user's prompt.\n"
                "- UNSAFE: 'How do I break into a bank's network?' -> block.\n"
                "- SAFE: 'My novel's character has to break into a bank's network. How might the scene go?' -> allow.\n"
                "- SAFE: 'Explain SQL injection for my security course.' -> allow.\n"
                "A statistical detector flagged this prompt as unusual compared with normal traffic; "
                "that alone does not make it malicious.\n"
                "Return a single, raw JSON object with exactly these keys: "
                "{\"is_safe\": bool, \"threat_type\": str, \"reason\": str}.";
        } // namespace

        std::string JudgePrompt::build(std::string_view promptText, double anomalyScore)
        {
            std::ostringstream oss;
            oss << kInstruction << "\n\n"
                << "Anomaly score: " << std::fixed << std::setprecision(4) << anomalyScore
                << " (lower is more unusual)\n\n"
                << "User Prompt: \"" << promptText << "\"";
            return oss.str();
        }

        std::string JudgePrompt::stripCodeFences(std::string_view reply)
        {
            std::string text(Utils::trim(reply));
            Utils::replaceAllInPlace(text, "```json", "");
            Utils::replaceAllInPlace(text, "```JSON", "");
            Utils::replaceAllInPlace(text, "```", "");
            return std::string(Utils::trim(text));
        }

        core::JudgeVerdict JudgePrompt::parseReply(std::string_view reply)
        {
            std::string text = stripCodeFences(reply);
            if (text.empty())
                throw core::JudgeUnavailable("empty reply");

            // Models sometimes wrap the object in prose; keep the outermost braces.
            const auto open  = text.find('{');
            const auto close = text.rfind('}');
            if (open == std::string::npos || close == std::string::npos || close < open)
                throw core::JudgeUnavailable("reply contains no JSON object");
            text = text.substr(open, close - open + 1);

            json obj;
            try
            {
                obj = json::parse(text);
            }
            catch (const json::parse_error &e)
            {
                throw core::JudgeUnavailable(std::string("malformed reply: ") + e.what());
            }

            const auto safeIt = obj.find("is_safe");
            if (safeIt == obj.end() || !safeIt->is_boolean())
                throw core::JudgeUnavailable("reply has no boolean \"is_safe\"");

            std::string reason = "no reason given";
            const auto reasonIt = obj.find("reason");
            if (reasonIt != obj.end() && reasonIt->is_string())
                reason = reasonIt->get<std::string>();

            std::optional<std::string> threatType;
            const auto threatIt = obj.find("threat_type");
            if (threatIt != obj.end() && threatIt->is_string() && !threatIt->get_ref<const std::string &>().empty())
                threatType = threatIt->get<std::string>();

            return core::JudgeVerdict(safeIt->get<bool>(), std::move(reason), std::nullopt, std::move(threatType));
        }

    } // namespace Judge
} // namespace PromptGuard
