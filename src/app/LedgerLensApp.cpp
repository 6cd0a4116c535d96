/**
 * @file LedgerLensApp.cpp
 * @brief Implementation of LedgerLensApp.
 */

#include "app/LedgerLensApp.hpp"
#include "application/TextNormalizer.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/LocalVectorStore.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaEmbeddingGenerator.hpp"
#include "infrastructure/QdrantIndex.hpp"
#include "infrastructure/UuidGenerator.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace ledgerlens::app {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::optional<std::string> OptionValue(const std::vector<std::string>& args, const std::string& name) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == name) return args[i + 1];
    }
    return std::nullopt;
}

bool HasFlag(const std::vector<std::string>& args, const std::string& name) {
    for (const auto& a : args) {
        if (a == name) return true;
    }
    return false;
}

/** @brief The stored form of a categorized candidate. */
domain::ExpenseRecord ToExpenseRecord(const domain::CandidateExpense& candidate, const domain::Categorization& result) {
    domain::ExpenseRecord e;
    e.date = candidate.date;
    e.amount = candidate.amount;
    e.vendor = result.vendor;
    e.category = result.decision.finalCategory;
    e.description = candidate.description;
    e.transcription = candidate.transcription;
    e.confidenceScore = result.decision.confidence;
    e.mlPrediction = result.decision.mlPrediction;
    e.llmCategory = candidate.llmCategory;
    e.needsConfirmation = result.decision.needsConfirmation;
    return e;
}

/** @brief Positional arguments, skipping `--name value` pairs and known flags. */
std::vector<std::string> Positionals(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i].rfind("--", 0) == 0) {
            if (args[i] != "--incremental" && args[i] != "--latest" && args[i] != "--record") ++i;
            continue;
        }
        out.push_back(args[i]);
    }
    return out;
}

} // namespace

LedgerLensApp::LedgerLensApp(infrastructure::AppSettings settings)
    : m_settings(std::move(settings)),
      m_persistence(std::make_shared<infrastructure::PersistenceService>()) {
    const auto& storage = m_settings.storage;
    const auto& training = m_settings.engine.training;

    auto client = std::make_shared<infrastructure::OllamaClient>(
        m_settings.embedding.host, m_settings.embedding.port, m_settings.embedding.timeoutSeconds);
    m_embedder = std::make_shared<infrastructure::OllamaEmbeddingGenerator>(
        client, m_settings.embedding.model, m_settings.embedding.dimension);

    std::shared_ptr<domain::SimilarityIndex> index;
    if (m_settings.index.backend == "qdrant") {
        index = std::make_shared<infrastructure::QdrantIndex>(
            m_settings.index.url, m_settings.index.apiKey, m_settings.embedding.dimension,
            m_settings.index.timeoutSeconds);
    } else {
        index = std::make_shared<infrastructure::LocalVectorStore>(
            m_settings.embedding.dimension, m_persistence, storage.dataDir / storage.vectorsFile,
            std::set<std::string>{training.mainPartition});
    }

    m_expenses = std::make_shared<infrastructure::JsonExpenseRepository>(storage.dataDir / storage.expensesFile,
                                                                        m_persistence);
    m_metrics = std::make_shared<infrastructure::MetricsStoreFs>(storage.dataDir / storage.metricsFile,
                                                                m_persistence);

    m_engine = std::make_shared<application::CategorizationEngine>(
        m_embedder, index, m_expenses, m_metrics, m_settings.engine,
        [] { return infrastructure::UuidGenerator::NewPartitionName(); });
    m_tasks = std::make_unique<application::TrainingTaskManager>(m_engine);
}

LedgerLensApp::~LedgerLensApp() {
    // Running training must finish before pending writes are flushed.
    m_tasks.reset();
    m_persistence->stop();
}

void LedgerLensApp::WarnIfModelMissing() const {
    if (!m_embedder->modelInstalled()) {
        std::cerr << "[LedgerLens] Embedding model '" << m_settings.embedding.model << "' is not listed by Ollama at "
                  << m_settings.embedding.host << ":" << m_settings.embedding.port
                  << "; run `ollama pull " << m_settings.embedding.model << "` first." << std::endl;
    }
}

int LedgerLensApp::PrintUsage() {
    std::cerr <<
        "Usage: ledgerlens [--config <settings.json>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  train [--incremental] [--timeout <seconds>]   Cross-validate and publish the model\n"
        "  evaluate                                     Cross-validate only, nothing is stored\n"
        "  classify <text>                              k-NN prediction for a canonical text\n"
        "  categorize [--record] <file.json | ->        Categorize candidate expense(s), optionally storing them\n"
        "  confirm <expense-id> <category>              Store a confirmed category and learn it\n"
        "  metrics [--limit <n>] [--latest]             Show recorded evaluation snapshots\n"
        "  categories                                   List the known category taxonomy\n";
    return 2;
}

int LedgerLensApp::Run(const std::string& command, const std::vector<std::string>& args) {
    if (command == "train") return CmdTrain(args);
    if (command == "evaluate") return CmdEvaluate(args);
    if (command == "classify") return CmdClassify(args);
    if (command == "categorize") return CmdCategorize(args);
    if (command == "confirm") return CmdConfirm(args);
    if (command == "metrics") return CmdMetrics(args);
    if (command == "categories") return CmdCategories(args);

    std::cerr << "Unknown command: " << command << "\n";
    return PrintUsage();
}

int LedgerLensApp::CmdTrain(const std::vector<std::string>& args) {
    auto type = HasFlag(args, "--incremental") ? domain::TrainingType::Incremental : domain::TrainingType::Full;

    std::optional<std::chrono::milliseconds> timeout;
    if (auto value = OptionValue(args, "--timeout")) {
        try {
            timeout = std::chrono::seconds(std::stoi(*value));
        } catch (const std::exception&) {
            std::cerr << "Invalid --timeout: " << *value << "\n";
            return 2;
        }
    }

    WarnIfModelMissing();
    auto status = m_tasks->SubmitTraining(type, timeout);
    m_tasks->Wait(status);

    std::lock_guard<std::mutex> lock(status->mutex);
    json out = {{"success", !status->failed.load()}, {"message", status->message}};
    if (status->snapshot) {
        out["metrics"] = infrastructure::JsonCodec::SnapshotToJson(*status->snapshot);
    }
    std::cout << out.dump(2) << std::endl;
    return status->failed ? 1 : 0;
}

int LedgerLensApp::CmdEvaluate(const std::vector<std::string>&) {
    WarnIfModelMissing();
    auto snapshot = m_engine->evaluate(application::CancellationToken());
    if (!snapshot) {
        std::cout << json{{"success", false}}.dump(2) << std::endl;
        return 1;
    }
    std::cout << infrastructure::JsonCodec::SnapshotToJson(*snapshot).dump(2) << std::endl;
    return 0;
}

int LedgerLensApp::CmdClassify(const std::vector<std::string>& args) {
    auto words = Positionals(args);
    if (words.empty()) return PrintUsage();

    std::string text;
    for (const auto& w : words) text += (text.empty() ? "" : " ") + w;

    auto prediction = m_engine->classify(application::TextNormalizer::canonicalText(text, "", ""));
    std::cout << infrastructure::JsonCodec::PredictionToJson(prediction).dump(2) << std::endl;
    return 0;
}

int LedgerLensApp::CmdCategorize(const std::vector<std::string>& args) {
    auto files = Positionals(args);
    if (files.empty()) return PrintUsage();

    json input;
    try {
        if (files[0] == "-") {
            input = json::parse(std::cin);
        } else {
            std::ifstream f(files[0]);
            if (!f.is_open()) {
                std::cerr << "Cannot open " << files[0] << "\n";
                return 1;
            }
            input = json::parse(f);
        }
    } catch (const json::exception& e) {
        std::cerr << "Invalid candidate JSON: " << e.what() << "\n";
        return 1;
    }

    const bool record = HasFlag(args, "--record");
    json out = json::array();
    const json items = input.is_array() ? input : json::array({input});
    for (const auto& item : items) {
        auto candidate = infrastructure::JsonCodec::CandidateFromJson(item);
        auto result = m_engine->categorize(candidate);
        json entry = infrastructure::JsonCodec::CategorizationToJson(result);
        if (record) {
            entry["expense_id"] = m_expenses->addExpense(ToExpenseRecord(candidate, result));
        }
        out.push_back(std::move(entry));
    }
    std::cout << (input.is_array() ? out : out[0]).dump(2) << std::endl;
    return 0;
}

int LedgerLensApp::CmdConfirm(const std::vector<std::string>& args) {
    auto words = Positionals(args);
    if (words.size() < 2) return PrintUsage();

    domain::ExpenseId id = 0;
    try {
        id = std::stoll(words[0]);
    } catch (const std::exception&) {
        std::cerr << "Invalid expense id: " << words[0] << "\n";
        return 2;
    }

    std::string category;
    for (std::size_t i = 1; i < words.size(); ++i) category += (i > 1 ? " " : "") + words[i];

    bool ok = m_engine->confirmCategory(id, category);
    std::cout << json{{"success", ok}, {"expense_id", id}, {"category", category}}.dump(2) << std::endl;
    return ok ? 0 : 1;
}

int LedgerLensApp::CmdMetrics(const std::vector<std::string>& args) {
    if (HasFlag(args, "--latest")) {
        auto latest = m_engine->latestMetrics();
        std::cout << (latest ? infrastructure::JsonCodec::SnapshotToJson(*latest) : json(nullptr)).dump(2)
                  << std::endl;
        return latest ? 0 : 1;
    }

    std::size_t limit = 10;
    if (auto value = OptionValue(args, "--limit")) {
        try {
            limit = static_cast<std::size_t>(std::stoul(*value));
        } catch (const std::exception&) {
            std::cerr << "Invalid --limit: " << *value << "\n";
            return 2;
        }
    }

    json out = json::array();
    for (const auto& snapshot : m_engine->recentMetrics(limit)) {
        json j = infrastructure::JsonCodec::SnapshotToJson(snapshot);
        // History view: the confusion data belongs to the latest snapshot only.
        j.erase("confusion_matrix");
        j.erase("confusion_labels");
        out.push_back(j);
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int LedgerLensApp::CmdCategories(const std::vector<std::string>&) {
    std::cout << json(m_engine->knownCategories()).dump(2) << std::endl;
    return 0;
}

} // namespace ledgerlens::app
