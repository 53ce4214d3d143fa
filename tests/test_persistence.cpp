#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <filesystem>
#include <fstream>

#include "common/config.hpp"
#include "daemon/persistence_gateway.hpp"
#include "daemon/status_store.hpp"
#include "daemon/triage_store.hpp"
#include "test_support.hpp"

class PersistenceTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testFreshStartDefaults();
    void testStoreRoundTrip();
    void testLegacyMigration();
    void testMigrationRunsOnce();
    void testCorruptLegacyFileKept();
    void testStatusesSurviveRestart();
    void testReadFailureFallsBackToDefaults();
    void testIntegrityCheck();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    std::filesystem::path dbPath() const;
    std::filesystem::path legacyPath() const;
    void writeLegacy(const std::string &content) const;
};

void PersistenceTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void PersistenceTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void PersistenceTests::init()
{
    std::error_code ec;
    std::filesystem::remove(dbPath(), ec);
    std::filesystem::remove(dbPath().string() + "-wal", ec);
    std::filesystem::remove(dbPath().string() + "-shm", ec);
    std::filesystem::remove(legacyPath(), ec);
    std::filesystem::remove(legacyPath().string() + triage::kLegacyBackupSuffix, ec);
}

std::filesystem::path PersistenceTests::dbPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString()) / "data"
        / triage::kDatabaseFileName;
}

std::filesystem::path PersistenceTests::legacyPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString()) / "data"
        / triage::kLegacyStateFileName;
}

void PersistenceTests::writeLegacy(const std::string &content) const
{
    std::filesystem::create_directories(legacyPath().parent_path());
    std::ofstream out(legacyPath());
    out << content;
}

void PersistenceTests::testFreshStartDefaults()
{
    triage::TriageStore store(dbPath().string());
    triage::PersistenceGateway gateway(store, legacyPath().string());

    const auto state = gateway.loadInitialState();
    QVERIFY(state.mode == triage::OperatingMode::Auto);
    QVERIFY(state.statuses.empty());
    QVERIFY(std::filesystem::exists(dbPath()));
}

void PersistenceTests::testStoreRoundTrip()
{
    triage::TriageStore store(dbPath().string());
    QVERIFY(!store.getMode().has_value());

    store.setMode("MANUAL");
    store.setStatus("n1", "Active");
    store.setStatus("n2", "Pending");
    store.setStatus("n1", "Review");
    store.removeStatus("n2");
    store.removeStatus("never-stored");

    QCOMPARE(store.getMode().value_or(""), std::string("MANUAL"));
    const auto statuses = store.getAllStatuses();
    QCOMPARE(statuses.size(), std::size_t(1));
    QCOMPARE(statuses.at("n1"), std::string("Review"));

    store.setMeta("schema_note", "v1");
    QCOMPARE(store.getMeta("schema_note").value_or(""), std::string("v1"));
    QVERIFY(!store.getMeta("missing").has_value());
}

void PersistenceTests::testLegacyMigration()
{
    writeLegacy(R"({"mode":"MANUAL","statuses":{"x":"Keep","y":"Bogus","z":"Blocked"}})");

    triage::TriageStore store(dbPath().string());
    triage::PersistenceGateway gateway(store, legacyPath().string());
    const auto state = gateway.loadInitialState();

    QVERIFY(state.mode == triage::OperatingMode::Manual);
    QCOMPARE(state.statuses.size(), std::size_t(3));
    QCOMPARE(state.statuses.at("x"), std::string("Pending"));
    QCOMPARE(state.statuses.at("y"), std::string("Pending"));
    QCOMPARE(state.statuses.at("z"), std::string("Blocked"));

    QVERIFY(!std::filesystem::exists(legacyPath()));
    QVERIFY(std::filesystem::exists(legacyPath().string() + triage::kLegacyBackupSuffix));
}

void PersistenceTests::testMigrationRunsOnce()
{
    writeLegacy(R"({"mode":"MANUAL","statuses":{"x":"Active"}})");
    {
        triage::TriageStore store(dbPath().string());
        triage::PersistenceGateway gateway(store, legacyPath().string());
        gateway.loadInitialState();
        store.setStatus("x", "Complete");
        store.setMode("AUTO");
    }

    // Second startup reads only the database; the backup is not re-imported.
    triage::TriageStore store(dbPath().string());
    triage::PersistenceGateway gateway(store, legacyPath().string());
    const auto state = gateway.loadInitialState();
    QVERIFY(state.mode == triage::OperatingMode::Auto);
    QCOMPARE(state.statuses.at("x"), std::string("Complete"));
    QVERIFY(!gateway.migrateLegacy());
}

void PersistenceTests::testCorruptLegacyFileKept()
{
    writeLegacy("{not json");

    triage::TriageStore store(dbPath().string());
    triage::PersistenceGateway gateway(store, legacyPath().string());
    const auto state = gateway.loadInitialState();

    QVERIFY(state.mode == triage::OperatingMode::Auto);
    QVERIFY(state.statuses.empty());
    QVERIFY(std::filesystem::exists(legacyPath()));
    QVERIFY(!std::filesystem::exists(legacyPath().string() + triage::kLegacyBackupSuffix));
}

void PersistenceTests::testStatusesSurviveRestart()
{
    {
        triage::TriageStore store(dbPath().string());
        triage::PersistenceGateway gateway(store, legacyPath().string());
        triage::StatusStore statuses(gateway, gateway.loadInitialState());
        statuses.set("n1", "Execute");
        statuses.setMode(triage::OperatingMode::Manual);
        QCOMPARE(statuses.get("n2"), std::string("Pending"));
    }

    triage::TriageStore store(dbPath().string());
    triage::PersistenceGateway gateway(store, legacyPath().string());
    triage::StatusStore statuses(gateway, gateway.loadInitialState());
    QVERIFY(statuses.mode() == triage::OperatingMode::Manual);
    QCOMPARE(statuses.peek("n1").value_or(""), std::string("Execute"));
    QCOMPARE(statuses.peek("n2").value_or(""), std::string("Pending"));
}

void PersistenceTests::testReadFailureFallsBackToDefaults()
{
    triage::testing::MemoryDurableStore durable;
    durable.mode = "MANUAL";
    durable.statuses = {{"n1", "Active"}};
    durable.failReads = true;

    triage::PersistenceGateway gateway(durable, legacyPath().string());
    const auto state = gateway.loadInitialState();
    QVERIFY(state.mode == triage::OperatingMode::Auto);
    QVERIFY(state.statuses.empty());

    durable.failReads = false;
    durable.mode = "SEMI";
    QVERIFY(gateway.loadInitialState().mode == triage::OperatingMode::Auto);
}

void PersistenceTests::testIntegrityCheck()
{
    triage::TriageStore store(dbPath().string());
    std::string message;
    QVERIFY(store.integrityCheck(&message));
}

QTEST_MAIN(PersistenceTests)
#include "test_persistence.moc"
