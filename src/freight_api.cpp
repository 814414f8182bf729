#include "freight_api.hpp"
#include "archive_tool.hpp"
#include "database_tools.hpp"
#include "dispatcher.hpp"
#include "freight_errors.hpp"
#include "ledger.hpp"
#include "notification.hpp"
#include "object_store.hpp"
#include "secret_manager.hpp"
#include <format>
#include <memory>

std::expected<AggregateResult, std::string> FreightAPI::runMove(const std::string& configFile, const MoveRequest& request) {
    std::shared_ptr<const FreightConfig> config;
    try {
        config = std::make_shared<const FreightConfig>(configFile);
        const TransportStrategy strategy = selectStrategy(request.moveType);

        SqliteLedger ledger(config->ledgerPath);
        SecretPolicy policy;
        policy.length = config->passwordLength;
        SecretManager secrets(ledger, SecretCipher(config->secretKey), policy);

        PgDumpTool dumper(config->tools);
        PgRestoreTool restorer(config->tools);
        PsqlConnection sql(config->tools);
        SevenZipArchiveTool archiver(config->tools);
        auto objectStore = makeObjectStore(config->objectStoreConfig);
        auto notifier = makeNotificationStrategy(config->telegramConfig, config->emailConfig);

        PipelineServices services{ledger, secrets, dumper, restorer, sql, archiver, objectStore.get()};
        JobDispatcher dispatcher(config, services, notifier.get());
        return dispatcher.dispatch(strategy, request);
    } catch (const ConfigurationError& e) {
        if (config) {
            config->logError(std::format("Configuration error: {}", e.what()));
        }
        return std::unexpected(std::format("Configuration error: {}", e.what()));
    } catch (const ZeroJobsError& e) {
        if (config) {
            config->logError(e.what());
        }
        return std::unexpected(std::format("No jobs: {}", e.what()));
    } catch (const std::exception& e) {
        if (config) {
            config->logError(std::format("Move failed: {}", e.what()));
        }
        return std::unexpected(std::format("Failed to run move: {}", e.what()));
    }
}

std::expected<int, std::string> FreightAPI::planJob(const std::string& configFile, const std::string& moveType,
                                                    const std::string& sourceDatabase, const JobDescriptor& job) {
    try {
        FreightConfig config(configFile);
        selectStrategy(moveType);
        if (!isValidObjectName(job.objectName)) {
            return std::unexpected(std::format("Invalid object name: '{}'", job.objectName));
        }
        if (job.destinationSchema && !isValidObjectName(*job.destinationSchema)) {
            return std::unexpected(std::format("Invalid destination schema: '{}'", *job.destinationSchema));
        }

        SqliteLedger ledger(config.ledgerPath);
        auto id = ledger.addJob(moveType, sourceDatabase, job);
        if (id) {
            config.logMessage(std::format("Planned {} job {} for {} ({})", moveType, *id, job.objectName, objectKindName(job.kind)));
        }
        return id;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to plan job: {}", e.what()));
    }
}
