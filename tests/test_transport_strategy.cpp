#include "freight_errors.hpp"
#include "ledger.hpp"
#include "test_support.hpp"
#include "transport_strategy.hpp"
#include <cassert>
#include <functional>
#include <iostream>
#include <string>

namespace {

using testsupport::TempDir;

bool throwsConfiguration(const std::function<void()>& action, const std::string& fragment = "") {
    try {
        action();
    } catch (const ConfigurationError& e) {
        return fragment.empty() || std::string(e.what()).find(fragment) != std::string::npos;
    }
    return false;
}

MoveRequest requestFor(const std::string& moveType) {
    MoveRequest request;
    request.moveType = moveType;
    request.controlHost = "dev1";
    request.controlDatabase = "sales";
    request.remoteHost = "lake";
    request.remoteDatabase = "lake";
    request.version = "2.4.0";
    request.tables["events"].insert("daily");
    return request;
}

void TestEveryKnownTypeIsSelectable() {
    const auto names = knownMoveTypes();
    assert(names.size() == 15);
    for (const auto& name : names) {
        auto strategy = selectStrategy(name);
        assert(strategy.moveType() == name);
        assert(!strategy.stages().empty());
        assert(strategy.stages().back().kind == StageKind::Finalize && "every strategy ends in finalize");
        strategy.validateRequest(requestFor(name), true, true);
    }
    assert(throwsConfiguration([] { selectStrategy("teleport"); }, "Unknown move type"));
    assert(throwsConfiguration([] { selectStrategy(""); }));
}

void TestProfiles() {
    auto backup = selectStrategy("backup_lake");
    assert(backup.profile() == StrategyProfile::StoreToArchive);
    assert(backup.parallel());
    assert(backup.runs(StageKind::Upload) && backup.runs(StageKind::LogResult));
    assert(!backup.runs(StageKind::Restore));

    auto reverse = selectStrategy("staging_to_process");
    assert(reverse.profile() == StrategyProfile::StoreToStoreReverse);
    assert(reverse.extractFrom() == StoreRole::Remote && reverse.restoreInto() == StoreRole::Control);

    auto partial = selectStrategy("s3_to_lake_partial");
    assert(partial.jobSource() == JobSource::ArchiveLog);
    assert(!partial.parallel() && "archive restores run serially");
    assert(partial.partialRestore());
    assert(!selectStrategy("s3_to_lake").partialRestore());

    auto structure = selectStrategy("structure_backup");
    assert(structure.stages().front().schemaOnly && "structure backups dump definitions only");
    assert(!structure.runs(StageKind::LogResult));

    auto seed = selectStrategy("build_runner_server");
    assert(seed.profile() == StrategyProfile::TemplateSeed);
    assert(seed.extractFrom() == StoreRole::Template);
    assert(!seed.parallel());
    assert(strategyProfileName(seed.profile()) == "template-seed");

    auto fail = selectStrategy("test_fail");
    assert(fail.profile() == StrategyProfile::Diagnostic);
    assert(fail.stages().size() == 2 && fail.stages().front().kind == StageKind::ForceFailure);
    assert(!fail.runs(StageKind::Extract) && "the diagnostic move touches no store");
    auto request = requestFor("test_fail");
    request.remoteHost.clear();
    request.remoteDatabase.clear();
    fail.validateRequest(request, false, false);
}

void TestArchiveSelection() {
    auto restore = selectStrategy("s3_to_lake");
    auto request = requestFor("s3_to_lake");
    request.archiveSource = "warehouse";
    request.archiveMoveType = "structure_backup";
    restore.validateRequest(request, true, true);

    request.archiveMoveType = "teleport";
    assert(throwsConfiguration([&] { restore.validateRequest(request, true, true); }, "archive move type"));

    request = requestFor("s3_to_lake");
    request.archiveSource = "bad name";
    assert(throwsConfiguration([&] { restore.validateRequest(request, true, true); }, "archive source"));

    request = requestFor("backup_lake");
    request.archiveSource = "warehouse";
    assert(throwsConfiguration([&] { selectStrategy("backup_lake").validateRequest(request, true, true); },
                               "archive restores"));
}

void TestInvalidStageOrderRejected() {
    StrategyDefinition broken{"broken", StrategyProfile::StoreToArchive,
                              {{StageKind::Extract}, {StageKind::Upload}, {StageKind::Finalize}}};
    assert(throwsConfiguration([&] { TransportStrategy strategy(broken); }, "Invalid stage list"));

    StrategyDefinition unfinished{"unfinished", StrategyProfile::StoreToStore,
                                  {{StageKind::Extract}, {StageKind::HashContent}}};
    assert(throwsConfiguration([&] { TransportStrategy strategy(unfinished); }));

    StrategyDefinition empty{"empty", StrategyProfile::StoreToStore, {}};
    assert(throwsConfiguration([&] { TransportStrategy strategy(empty); }));

    StrategyDefinition unnamed{"", StrategyProfile::StoreToStore, {{StageKind::Extract}, {StageKind::Finalize}}};
    assert(throwsConfiguration([&] { TransportStrategy strategy(unnamed); }, "Move type"));
}

void TestMissingRequestFields() {
    auto production = selectStrategy("production");
    auto request = requestFor("production");
    request.version.clear();
    assert(throwsConfiguration([&] { production.validateRequest(request, true, true); }, "Version"));

    request = requestFor("production");
    assert(throwsConfiguration([&] { production.validateRequest(request, false, true); }, "object store"));
    assert(throwsConfiguration([&] { production.validateRequest(request, true, false); }, "secret_key"));

    request.remoteDatabase.clear();
    assert(throwsConfiguration([&] { production.validateRequest(request, true, true); }, "destination"));

    request = requestFor("move_schemas");
    request.controlHost.clear();
    assert(throwsConfiguration([&] { selectStrategy("move_schemas").validateRequest(request, false, false); }, "source"));

    request = requestFor("move_schemas");
    selectStrategy("move_schemas").validateRequest(request, false, false);
    request.password = "";
    assert(throwsConfiguration([&] { selectStrategy("move_schemas").validateRequest(request, false, false); }, "Password"));

    request = requestFor("s3_to_lake_partial");
    request.tables.clear();
    assert(throwsConfiguration([&] { selectStrategy("s3_to_lake_partial").validateRequest(request, true, true); }, "tables"));

    request = requestFor("structure_backup");
    request.remoteHost.clear();
    request.remoteDatabase.clear();
    selectStrategy("structure_backup").validateRequest(request, true, true);

    request = requestFor("backup_lake");
    assert(throwsConfiguration([&] { selectStrategy("move_schemas").validateRequest(request, true, true); }));
}

void TestTemplateSeedSession() {
    TempDir dir;
    SqliteLedger ledger((dir / "ledger.db").string());
    SecretManager secrets(ledger, SecretCipher("master"), SecretPolicy{});
    auto seed = selectStrategy("build_runner_server");

    JobDescriptor job;
    job.objectName = "runner";
    const int id = ledger.addJob("build_runner_server", "control", job).value();
    assert(ledger.writeField(id, LedgerField::Results, "Success"));
    assert(ledger.writeField(id, LedgerField::IncludeFlag, "N"));

    assert(seed.prepareSession(ledger));
    assert(!ledger.readField(id, LedgerField::Results).value().has_value() && "bookkeeping is cleared");
    assert(ledger.readField(id, LedgerField::IncludeFlag).value().value_or("") == "Y" &&
           "a fully successful previous run is re-included");

    assert(secrets.resolve("control", std::nullopt));
    auto request = requestFor("build_runner_server");
    request.controlDatabase = "control";
    assert(seed.cleanupSession(secrets, request));
    assert(!ledger.loadSecret("control").value().has_value() && "the control secret is forgotten");

    // other profiles leave the ledger alone
    assert(ledger.writeField(id, LedgerField::Results, "Error"));
    assert(selectStrategy("backup_lake").prepareSession(ledger));
    assert(ledger.readField(id, LedgerField::Results).value().value_or("") == "Error");
}

} // namespace

int main() {
    TestEveryKnownTypeIsSelectable();
    TestProfiles();
    TestInvalidStageOrderRejected();
    TestMissingRequestFields();
    TestArchiveSelection();
    TestTemplateSeedSession();
    std::cout << "transport strategy test ok\n";
    return 0;
}
