#ifndef MODELMIG_MIGRATION_COLLECTIONS_H_
#define MODELMIG_MIGRATION_COLLECTIONS_H_

namespace modelmig {
namespace migration {

// Collection names
namespace collections {
constexpr const char* kModels = "models";
constexpr const char* kMigrations = "migrations";
constexpr const char* kMigrationStatus = "migrations.status";
constexpr const char* kMigrationTarget = "migrations.target";
constexpr const char* kMinionSync = "migrations.minionsync";
} // namespace collections

// Field names of documents in "models"
namespace model_fields {
constexpr const char* kName = "name";
constexpr const char* kOwner = "owner";
constexpr const char* kControllerUUID = "controller-uuid";
constexpr const char* kLife = "life";
constexpr const char* kMigrationMode = "migration-mode";
constexpr const char* kActiveMigration = "active-migration";
constexpr const char* kMigrationEpoch = "migration-epoch";
constexpr const char* kIsControllerModel = "is-controller-model";
} // namespace model_fields

// Field names of documents in "migrations"
namespace migration_fields {
constexpr const char* kModelUUID = "model-uuid";
constexpr const char* kAttempt = "attempt";
constexpr const char* kInitiatedBy = "initiated-by";
} // namespace migration_fields

// Field names of documents in "migrations.status"
namespace status_fields {
constexpr const char* kModelUUID = "model-uuid";
constexpr const char* kPhase = "phase";
constexpr const char* kPhaseChangedTime = "phase-changed-time";
constexpr const char* kStatusMessage = "status-message";
constexpr const char* kStartTime = "start-time";
constexpr const char* kSuccessTime = "success-time";
constexpr const char* kEndTime = "end-time";
constexpr const char* kPreviousMode = "previous-mode";
} // namespace status_fields

// Field names of documents in "migrations.target"
namespace target_fields {
constexpr const char* kControllerTag = "controller-tag";
constexpr const char* kAddrs = "addrs";
constexpr const char* kCACert = "ca-cert";
constexpr const char* kAuthTag = "auth-tag";
constexpr const char* kPassword = "password";
} // namespace target_fields

// Field names of documents in "migrations.minionsync"
namespace report_fields {
constexpr const char* kMigrationId = "migration-id";
constexpr const char* kPhase = "phase";
constexpr const char* kEntityKey = "entity-key";
constexpr const char* kSuccess = "success";
} // namespace report_fields

// Sequence name used for migration attempts
constexpr const char* kMigrationSequence = "modelmigration";

} // namespace migration
} // namespace modelmig

#endif // MODELMIG_MIGRATION_COLLECTIONS_H_
