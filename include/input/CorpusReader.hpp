#pragma once

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "core/Embedding.hpp"

namespace PromptGuard
{
    namespace Input
    {
        /// One prompt of a corpus or of an evaluation input file.
        struct CorpusEntry
        {
            std::string                    prompt;
            std::optional<core::Embedding> embedding;   ///< Present for JSON-lines input.
        };

        enum class CorpusFormat
        {
            TEXT,        // one prompt per line; '#' comments and blank lines skipped
            JSON_LINES   // {"prompt": "...", "embedding": [..]} per line
        };

        /**
         * CorpusReader
         *
         * Responsibilities:
         *  - Stream prompts (and optional precomputed embeddings) from a file.
         *  - Detect the format from the extension (.jsonl / .ndjson) or, failing
         *    that, from the first non-blank line starting with '{'.
         *
         * Design notes:
         *  - Owns its std::ifstream (RAII); not copyable, movable.
         *  - A malformed JSON line throws std::runtime_error naming the line,
         *    so a broken corpus never silently shrinks.
         */
        class CorpusReader
        {
        public:
            CorpusReader() = default;

            /// Open immediately; check isOpen() afterwards.
            explicit CorpusReader(const std::string &filePath);

            CorpusReader(const CorpusReader &)            = delete;
            CorpusReader &operator=(const CorpusReader &) = delete;

            CorpusReader(CorpusReader &&)            = default;
            CorpusReader &operator=(CorpusReader &&) = default;

            /// Returns false if the file cannot be opened.
            bool open(const std::string &filePath);

            bool isOpen() const noexcept { return m_stream.is_open(); }

            CorpusFormat format() const noexcept { return m_format; }

            const std::string &filePath() const noexcept { return m_filePath; }

            /**
             * Next entry, or std::nullopt at end of file.
             * Throws std::runtime_error on a malformed JSON line.
             */
            std::optional<CorpusEntry> nextEntry();

            /// Number of physical lines consumed so far.
            std::size_t lineNumber() const noexcept { return m_lineNumber; }

            /**
             * Read a whole file. Throws std::runtime_error if it cannot be
             * opened or contains a malformed line.
             */
            static std::vector<CorpusEntry> readAll(const std::string &filePath);

            /// Parse one JSON-lines record; throws std::runtime_error.
            static CorpusEntry parseJsonLine(const std::string &line);

        private:
            CorpusFormat detectFormat();

        private:
            std::ifstream m_stream;
            std::string   m_filePath;
            CorpusFormat  m_format     = CorpusFormat::TEXT;
            std::size_t   m_lineNumber = 0;
        };

        /// Embeddings of every entry that carries one, in file order.
        std::vector<core::Embedding> embeddingsOf(const std::vector<CorpusEntry> &entries);

    } // namespace Input
} // namespace PromptGuard
