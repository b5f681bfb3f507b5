#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "TestSupport.hpp"

#include "core/Errors.hpp"
#include "input/CorpusReader.hpp"
#include "input/HashingEmbedder.hpp"
#include "input/PrecomputedEmbedder.hpp"

namespace {

using PromptGuard::Input::CorpusEntry;
using PromptGuard::Input::CorpusFormat;
using PromptGuard::Input::CorpusReader;
using PromptGuard::Input::HashingEmbedder;
using PromptGuard::Input::PrecomputedEmbedder;

static void writeFile(const std::string& path, const std::string& text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

static double l2(const core::Embedding& e)
{
    double s = 0.0;
    for (double v : e)
        s += v * v;
    return std::sqrt(s);
}

static void runHashingEmbedderShape()
{
    const HashingEmbedder embedder(64);
    REQUIRE(embedder.dimension() == 64, "configured dimension");

    const auto e = embedder.embed("What is the capital of France?");
    REQUIRE(e.size() == 64, "vector has the configured length");
    REQUIRE(std::abs(l2(e) - 1.0) < 1e-9, "vector is unit length");

    const auto empty = embedder.embed("");
    REQUIRE(empty.size() == 64 && l2(empty) == 0.0, "empty text is the zero vector");
    REQUIRE(l2(embedder.embed(" \t\n ")) == 0.0, "whitespace-only text is the zero vector");

    REQUIRE(HashingEmbedder().dimension() == HashingEmbedder::kDefaultDimension, "default dimension");
    REQUIRE_THROWS(HashingEmbedder(0), std::invalid_argument, "zero dimension rejected");
    REQUIRE_THROWS(HashingEmbedder(16, 4, 3), std::invalid_argument, "inverted n-gram range rejected");
}

static void runHashingEmbedderNormalises()
{
    const HashingEmbedder embedder(128);
    const auto a = embedder.embed("Tell me a joke");
    REQUIRE(a == embedder.embed("Tell me a joke"), "embedding is deterministic");
    REQUIRE(a == embedder.embed("  TELL   me\ta JOKE "), "case and whitespace runs are normalised");
    REQUIRE(a != embedder.embed("Tell me a story"), "different text gives a different vector");

    // Related prompts share n-grams, unrelated ones mostly do not.
    auto dot = [](const core::Embedding& x, const core::Embedding& y) {
        double s = 0.0;
        for (std::size_t i = 0; i < x.size(); ++i)
            s += x[i] * y[i];
        return s;
    };
    const double near = dot(a, embedder.embed("Tell me a funny joke"));
    const double far  = dot(a, embedder.embed("Quantum chromodynamics lattice"));
    REQUIRE(near > far, "similar prompts are closer than unrelated ones");
}

static void runTextCorpus()
{
    const std::string path = testsupport::tempPath("corpus.txt");
    writeFile(path, "# benign baseline\nWhat is the weather?\r\n\n   \nExplain photosynthesis.\n");

    CorpusReader reader(path);
    REQUIRE(reader.isOpen(), "text corpus opens");
    REQUIRE(reader.format() == CorpusFormat::TEXT, "plain lines are TEXT");

    const auto first = reader.nextEntry();
    REQUIRE(first && first->prompt == "What is the weather?", "CR stripped, comment skipped");
    REQUIRE(!first->embedding.has_value(), "text entries carry no embedding");

    const auto second = reader.nextEntry();
    REQUIRE(second && second->prompt == "Explain photosynthesis.", "blank lines skipped");
    REQUIRE(!reader.nextEntry().has_value(), "end of file");
    REQUIRE(reader.lineNumber() == 5, "every physical line counted");

    std::filesystem::remove(path);
}

static void runJsonLinesCorpus()
{
    const std::string path = testsupport::tempPath("corpus.data");
    writeFile(path,
              "{\"prompt\": \"hello\", \"embedding\": [0.5, -0.5, 1]}\n"
              "\n"
              "{\"prompt\": \"  spaced  \", \"embedding\": [1, 2, 3]}\n"
              "{\"prompt\": \"no vector\"}\n");

    const auto entries = CorpusReader::readAll(path);
    REQUIRE(entries.size() == 3, "three records");
    REQUIRE(entries[0].prompt == "hello", "prompt field");
    REQUIRE(entries[0].embedding && (*entries[0].embedding)[1] == -0.5, "embedding field");
    REQUIRE(!entries[2].embedding.has_value(), "embedding is optional");
    REQUIRE(PromptGuard::Input::embeddingsOf(entries).size() == 2, "only entries with vectors are collected");

    CorpusReader reader(path);
    REQUIRE(reader.format() == CorpusFormat::JSON_LINES, "format sniffed from content");

    std::filesystem::remove(path);
}

static void runMalformedJsonLineNamesLocation()
{
    const std::string path = testsupport::tempPath("broken.jsonl");
    writeFile(path, "{\"prompt\": \"ok\"}\n{\"prompt\": 42}\n");

    bool thrown = false;
    try
    {
        (void)CorpusReader::readAll(path);
    }
    catch (const std::runtime_error& e)
    {
        thrown = true;
        REQUIRE(std::string(e.what()).find("broken.jsonl:2") != std::string::npos,
                "error names file and line: " << e.what());
    }
    REQUIRE(thrown, "malformed record must throw");

    REQUIRE_THROWS(CorpusReader::parseJsonLine("{\"prompt\": \"x\", \"embedding\": []}"), std::runtime_error,
                   "empty embedding rejected");
    REQUIRE_THROWS(CorpusReader::parseJsonLine("{\"prompt\": \"x\", \"embedding\": [1, \"a\"]}"), std::runtime_error,
                   "non-numeric embedding rejected");
    REQUIRE_THROWS(CorpusReader::readAll(testsupport::tempPath("does-not-exist.txt")), std::runtime_error,
                   "missing file rejected");

    std::filesystem::remove(path);
}

static void runPrecomputedEmbedder()
{
    std::vector<CorpusEntry> entries;
    entries.push_back({"hello", core::Embedding{1.0, 0.0}});
    entries.push_back({"bye", core::Embedding{0.0, 1.0}});
    entries.push_back({"unembedded", std::nullopt});

    const PrecomputedEmbedder embedder(entries);
    REQUIRE(embedder.dimension() == 2, "dimension from the vectors");
    REQUIRE(embedder.size() == 2, "entries without vectors ignored");
    REQUIRE(embedder.embed("bye") == (core::Embedding{0.0, 1.0}), "exact lookup");
    REQUIRE(embedder.embed("  hello \n") == (core::Embedding{1.0, 0.0}), "trimmed lookup");
    REQUIRE_THROWS(embedder.embed("unknown"), core::EmbeddingServiceError, "unknown prompt is a service error");

    const std::vector<CorpusEntry> textOnly{{"x", std::nullopt}};
    REQUIRE_THROWS(PrecomputedEmbedder(textOnly), std::invalid_argument, "no vectors rejected");
    const std::vector<CorpusEntry> ragged{{"a", core::Embedding{1.0}}, {"b", core::Embedding{1.0, 2.0}}};
    REQUIRE_THROWS(PrecomputedEmbedder(ragged), std::invalid_argument, "ragged vectors rejected");
}

} // namespace

int main()
{
    testsupport::quietLogs();

    runHashingEmbedderShape();
    runHashingEmbedderNormalises();
    runTextCorpus();
    runJsonLinesCorpus();
    runMalformedJsonLineNamesLocation();
    runPrecomputedEmbedder();

    std::cout << "[PASS] TestInput\n";
    return 0;
}
