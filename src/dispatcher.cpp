#include "dispatcher.hpp"
#include "freight_errors.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <format>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>

namespace {

void requireName(const std::string& name, const std::string& what) {
    if (!isValidObjectName(name)) {
        throw ConfigurationError(std::format("Invalid {} name: '{}'", what, name));
    }
}

std::optional<std::string> malformedName(const JobDescriptor& job) {
    if (!isValidObjectName(job.objectName)) {
        return std::format("Invalid object name: '{}'", job.objectName);
    }
    if (job.destinationSchema && !isValidObjectName(*job.destinationSchema)) {
        return std::format("Invalid destination schema name: '{}'", *job.destinationSchema);
    }
    return std::nullopt;
}

} // namespace

JobDispatcher::JobDispatcher(std::shared_ptr<const FreightConfig> config, PipelineServices services,
                             NotificationStrategy* notifier)
    : config(std::move(config)), services(services), notifier(notifier) {
    if (!this->config) {
        throw std::invalid_argument("JobDispatcher requires a configuration");
    }
}

JobQuery JobDispatcher::queryFor(const TransportStrategy& strategy, const MoveRequest& request) {
    JobQuery query{strategy.moveType(), request.controlDatabase, strategy.jobSource()};
    if (strategy.jobSource() == JobSource::ArchiveLog) {
        query.sourceDatabase = request.archiveSource.value_or(request.controlDatabase);
        query.archivedBy = request.archiveMoveType.value_or("");
    }
    return query;
}

std::string JobDispatcher::describeRun(const TransportStrategy& strategy, const MoveRequest& request) {
    std::string step = std::format("{} {}.{}", strategy.moveType(), request.controlHost, request.controlDatabase);
    if (!request.remoteHost.empty() && !request.remoteDatabase.empty()) {
        step += std::format(" -> {}.{}", request.remoteHost, request.remoteDatabase);
    }
    return step;
}

int JobDispatcher::workerCountFor(const TransportStrategy& strategy, const MoveRequest& request) const {
    const int requested = request.threads.value_or(config->processingThreads);
    if (requested < FreightConfig::kMinProcessingThreads || requested > FreightConfig::kMaxProcessingThreads) {
        throw ConfigurationError(std::format("Processing threads must be between {} and {}, got {}",
                                             FreightConfig::kMinProcessingThreads, FreightConfig::kMaxProcessingThreads,
                                             requested));
    }
    return strategy.parallel() ? requested : 1;
}

JobDispatcher::Stores JobDispatcher::resolveStores(const TransportStrategy& strategy, const MoveRequest& request) const {
    const ConnectionDescriptor control = config->resolveConnection(request.controlHost, request.controlDatabase);
    std::optional<ConnectionDescriptor> remote;
    if (!request.remoteHost.empty() && !request.remoteDatabase.empty()) {
        remote = config->resolveConnection(request.remoteHost, request.remoteDatabase);
    }

    auto storeFor = [&](StoreRole role) -> ConnectionDescriptor {
        switch (role) {
            case StoreRole::Control: return control;
            case StoreRole::Template: return config->resolveConnection(request.controlHost, config->standardTemplateName);
            case StoreRole::Remote:
                if (!remote) {
                    throw ConfigurationError(std::format("{} move needs a destination store", strategy.moveType()));
                }
                return *remote;
        }
        throw ConfigurationError("Unknown store role");
    };

    Stores stores{storeFor(strategy.extractFrom()), std::nullopt};
    if (strategy.runs(StageKind::Restore) || strategy.runs(StageKind::Relocate)) {
        stores.destination = storeFor(strategy.restoreInto());
    }

    for (const auto& [schema, tables] : request.tables) {
        requireName(schema, "schema");
        for (const auto& table : tables) {
            requireName(table, "table");
        }
    }
    return stores;
}

std::vector<std::shared_ptr<const JobContext>> JobDispatcher::buildContexts(const TransportStrategy& strategy,
                                                                            const MoveRequest& request,
                                                                            const std::vector<JobDescriptor>& jobs,
                                                                            std::size_t& skipped,
                                                                            std::vector<JobOutcome>& rejected) const {
    const Stores stores = resolveStores(strategy, request);
    const std::string runDate = localTimeNow("%Y%m%d");
    std::vector<std::shared_ptr<const JobContext>> contexts;
    skipped = 0;
    for (const auto& job : jobs) {
        if (auto problem = malformedName(job)) {
            JobOutcome outcome;
            outcome.jobId = job.id;
            outcome.objectName = job.objectName;
            outcome.finalState = std::string(pipelineStateName(PipelineState::Failed));
            outcome.error = std::format("{}: {}", kInvalidObjectLabel, *problem);
            rejected.push_back(std::move(outcome));
            continue;
        }

        auto context = std::make_shared<JobContext>();
        if (strategy.partialRestore()) {
            auto it = request.tables.find(job.objectName);
            if (it == request.tables.end()) {
                ++skipped;
                continue;
            }
            context->tableSubset = it->second;
        }

        context->jobId = job.id;
        context->objectName = job.objectName;
        context->kind = job.kind;
        context->destinationSchema = job.destinationSchema;
        context->moveType = strategy.moveType();
        context->runDate = runDate;
        context->source = stores.source;
        context->destination = stores.destination;
        context->archiveLocation = job.archiveLocation;
        context->secretCandidate = request.password;
        context->sealedSecret = job.sealedSecret;
        // Archives are sealed under the database they were taken from
        context->secretOwner = strategy.jobSource() == JobSource::ArchiveLog
                                   ? request.archiveSource.value_or(request.controlDatabase)
                                   : request.controlDatabase;
        context->version = request.version;
        context->retainInclusion = config->repeatJobs;
        context->logArchive = request.logging;
        context->config = config;
        contexts.push_back(std::move(context));
    }
    return contexts;
}

AggregateResult JobDispatcher::dispatch(const TransportStrategy& strategy, const MoveRequest& request) {
    strategy.validateRequest(request, services.objectStore != nullptr, !config->secretKey.empty());
    const int workers = workerCountFor(strategy, request);
    // Unknown hosts fail here, before the ledger is touched
    resolveStores(strategy, request);

    std::optional<int> runStep;
    if (request.logging) {
        auto opened = services.ledger.beginRunStep(kRunSection, describeRun(strategy, request));
        if (opened) {
            runStep = *opened;
        } else {
            config->logError(std::format("Unable to write the run log: {}", opened.error()));
        }
    }

    AggregateResult result;
    try {
        result = runBatch(strategy, request, workers);
    } catch (const std::exception& e) {
        closeRunStep(runStep, "Error", e.what());
        throw;
    }
    closeRunStep(runStep, result.ok() ? "Success" : "Error", result.summary(strategy.moveType()));
    return result;
}

void JobDispatcher::closeRunStep(std::optional<int> runStep, const std::string& results, const std::string& detail) const {
    if (!runStep) {
        return;
    }
    auto closed = services.ledger.endRunStep(*runStep, results, detail);
    if (!closed) {
        config->logError(std::format("Unable to update the run log: {}", closed.error()));
    }
}

AggregateResult JobDispatcher::runBatch(const TransportStrategy& strategy, const MoveRequest& request, int workers) {
    auto prepared = strategy.prepareSession(services.ledger);
    if (!prepared) {
        throw std::runtime_error(std::format("Failed to prepare {} session: {}", strategy.moveType(), prepared.error()));
    }

    auto jobs = services.ledger.listEligibleJobs(queryFor(strategy, request));
    if (!jobs) {
        throw std::runtime_error(std::format("Failed to list {} jobs: {}", strategy.moveType(), jobs.error()));
    }
    if (jobs->empty()) {
        throw ZeroJobsError(std::format("No jobs to process for {} on {}", strategy.moveType(), request.controlDatabase));
    }

    AggregateResult result;
    auto contexts = buildContexts(strategy, request, *jobs, result.skipped, result.outcomes);
    if (result.skipped > 0) {
        config->logMessage(std::format("{}: skipped {} job(s) outside the requested tables", strategy.moveType(), result.skipped));
    }
    for (const auto& outcome : result.outcomes) {
        recordRejected(outcome);
    }
    if (contexts.empty() && result.outcomes.empty()) {
        throw ZeroJobsError(std::format("All {} {} job(s) were skipped", jobs->size(), strategy.moveType()));
    }

    config->logMessage(std::format("{} ({}): processing {} job(s) with {} worker(s)", strategy.moveType(),
                                   strategyProfileName(strategy.profile()), contexts.size(), workers));

    std::mutex outcomeMutex;
    WorkerPool pool(workers);
    const bool started = pool.start([&](const std::shared_ptr<const JobContext>& context, int workerId) {
        config->logMessage(std::format("Worker-{} claimed job {}", workerId, context->label()));
        JobOutcome outcome = runJob(strategy, context);
        std::lock_guard<std::mutex> lock(outcomeMutex);
        result.outcomes.push_back(std::move(outcome));
    });
    if (!started) {
        throw std::runtime_error("Failed to start the worker pool");
    }
    for (auto& context : contexts) {
        pool.submit(std::move(context));
    }
    pool.finish();

    auto cleaned = strategy.cleanupSession(services.secrets, request);
    if (!cleaned) {
        config->logError(std::format("Failed to clean up {} session: {}", strategy.moveType(), cleaned.error()));
    }

    report(strategy, result);
    return result;
}

void JobDispatcher::recordRejected(const JobOutcome& outcome) const {
    config->logError(std::format("Job {} ({}) not started: {}", outcome.jobId, outcome.objectName, outcome.error));
    auto results = services.ledger.writeField(outcome.jobId, LedgerField::Results, "Error");
    if (!results) {
        config->logError(std::format("Failed to record results for job {}: {}", outcome.jobId, results.error()));
    }
    auto message = services.ledger.writeField(outcome.jobId, LedgerField::ErrorMessage, kInvalidObjectLabel);
    if (!message) {
        config->logError(std::format("Failed to record error message for job {}: {}", outcome.jobId, message.error()));
    }
}

JobOutcome JobDispatcher::runJob(const TransportStrategy& strategy, const std::shared_ptr<const JobContext>& context) const {
    if (config->startJitterSeconds > 0) {
        thread_local std::mt19937 generator{std::random_device{}()};
        std::uniform_int_distribution<int> delay(0, config->startJitterSeconds);
        std::this_thread::sleep_for(std::chrono::seconds(delay(generator)));
    }

    try {
        Pipeline pipeline(context, services);
        return pipeline.execute(strategy.stages());
    } catch (const std::exception& e) {
        config->logError(std::format("{} {}: {}", strategy.moveType(), context->label(), e.what()));
        JobOutcome outcome;
        outcome.jobId = context->jobId;
        outcome.objectName = context->objectName;
        outcome.finalState = std::string(pipelineStateName(PipelineState::Failed));
        outcome.error = e.what();
        return outcome;
    }
}

void JobDispatcher::report(const TransportStrategy& strategy, const AggregateResult& result) const {
    const std::string summary = result.summary(strategy.moveType());
    if (result.ok()) {
        config->logMessage(summary);
    } else {
        config->logError(summary);
    }
    if (notifier) {
        auto sent = notifier->notify(summary);
        if (!sent) {
            config->logError(std::format("Notification failed: {}", sent.error()));
        }
    }
}
