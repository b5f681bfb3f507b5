// Error taxonomy shared by the scorer, the model lifecycle, the embedder
// and judge bindings. The decision fuser maps each of these onto a
// blocking reason code; only callers of the lower layers see them raw.

#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace core
{

/**
 * @brief Root of every PromptGuard failure.
 */
class PromptGuardError : public std::runtime_error
{
public:
    explicit PromptGuardError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @brief Embedding length differs from the fitted model's dimension.
 *
 * Caller programming error; never retried.
 */
class DimensionMismatch : public PromptGuardError
{
public:
    DimensionMismatch(std::size_t expected, std::size_t actual)
        : PromptGuardError("embedding dimension mismatch: model expects " +
                           std::to_string(expected) + ", got " + std::to_string(actual)),
          m_expected(expected),
          m_actual(actual)
    {
    }

    std::size_t expected() const noexcept { return m_expected; }
    std::size_t actual() const noexcept { return m_actual; }

private:
    std::size_t m_expected;
    std::size_t m_actual;
};

/**
 * @brief No fitted model is published (never fitted, or invalidated).
 */
class ModelNotReady : public PromptGuardError
{
public:
    explicit ModelNotReady(const std::string& what = "anomaly model is not fitted")
        : PromptGuardError(what)
    {
    }
};

/**
 * @brief A persisted model artifact exists but cannot be reconstructed.
 *
 * Distinct from "not found". Operationally handled like ModelNotReady.
 */
class ModelCorrupt : public PromptGuardError
{
public:
    explicit ModelCorrupt(const std::string& what)
        : PromptGuardError("model artifact corrupt: " + what)
    {
    }
};

/// The embedding collaborator failed to produce a vector.
class EmbeddingServiceError : public PromptGuardError
{
public:
    explicit EmbeddingServiceError(const std::string& what)
        : PromptGuardError("embedding service error: " + what)
    {
    }
};

/// The judge could not be reached, timed out, or replied with garbage.
class JudgeUnavailable : public PromptGuardError
{
public:
    explicit JudgeUnavailable(const std::string& what)
        : PromptGuardError("judge unavailable: " + what)
    {
    }
};

/// The request was cancelled while awaiting the judge; no decision exists.
class RequestCancelled : public PromptGuardError
{
public:
    RequestCancelled()
        : PromptGuardError("request cancelled while awaiting judge")
    {
    }
};

} // namespace core

#endif // CORE_ERRORS_HPP
