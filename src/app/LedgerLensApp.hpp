/**
 * @file LedgerLensApp.hpp
 * @brief Composition root of the command line tool.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "application/CategorizationEngine.hpp"
#include "application/TrainingTaskManager.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonExpenseRepository.hpp"
#include "infrastructure/MetricsStoreFs.hpp"
#include "infrastructure/OllamaEmbeddingGenerator.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace ledgerlens::app {

/**
 * @class LedgerLensApp
 * @brief Wires the configured adapters into the engine and runs one CLI command.
 */
class LedgerLensApp {
public:
    explicit LedgerLensApp(infrastructure::AppSettings settings);
    ~LedgerLensApp();

    /** @brief Runs `command` with its arguments. Returns the process exit code. */
    int Run(const std::string& command, const std::vector<std::string>& args);

    static int PrintUsage();

private:
    int CmdTrain(const std::vector<std::string>& args);
    int CmdEvaluate(const std::vector<std::string>& args);
    int CmdClassify(const std::vector<std::string>& args);
    int CmdCategorize(const std::vector<std::string>& args);
    int CmdConfirm(const std::vector<std::string>& args);
    int CmdMetrics(const std::vector<std::string>& args);
    int CmdCategories(const std::vector<std::string>& args);
    void WarnIfModelMissing() const;

    infrastructure::AppSettings m_settings;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    std::shared_ptr<infrastructure::OllamaEmbeddingGenerator> m_embedder;
    std::shared_ptr<infrastructure::JsonExpenseRepository> m_expenses;
    std::shared_ptr<infrastructure::MetricsStoreFs> m_metrics;
    std::shared_ptr<application::CategorizationEngine> m_engine;
    std::unique_ptr<application::TrainingTaskManager> m_tasks;
};

} // namespace ledgerlens::app
