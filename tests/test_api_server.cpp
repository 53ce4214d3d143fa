#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QLocalSocket>
#include <QTemporaryDir>

#include <algorithm>
#include <memory>

#include <nlohmann/json.hpp>

#include "daemon/automation_gateway.hpp"
#include "daemon/event_hub.hpp"
#include "daemon/persistence_gateway.hpp"
#include "daemon/snapshot_cache.hpp"
#include "daemon/status_store.hpp"
#include "daemon/triage_api_server.hpp"
#include "test_support.hpp"

using triage::ItemKind;
using triage::testing::drain;
using triage::testing::makeItem;
using triage::testing::withEvent;

namespace {

struct Fixture {
    explicit Fixture(const std::string &legacyPath)
        : gateway(durable, legacyPath)
        , statuses(gateway, triage::PersistedState{})
        , cache(provider, statuses, hub)
        , automation(launcher, hub)
        , server(statuses, cache, hub, automation, provider)
    {
        provider.setItems({makeItem("n1", ItemKind::Note, "Standup"),
                           makeItem("n2", ItemKind::Note, "Retro"),
                           makeItem("d1", ItemKind::Document, "Plan")});
    }

    nlohmann::json call(const std::string &method,
                        const nlohmann::json &params = nlohmann::json::object())
    {
        const nlohmann::json request{{"id", 7}, {"method", method}, {"params", params}};
        const QByteArray response =
            server.handleRequestPayload(QByteArray::fromStdString(request.dump()));
        return nlohmann::json::parse(response.toStdString());
    }

    triage::testing::MemoryDurableStore durable;
    triage::testing::FakeProvider provider;
    triage::testing::FakeLauncher launcher;
    triage::PersistenceGateway gateway;
    triage::StatusStore statuses;
    triage::EventHub hub;
    triage::SnapshotCache cache;
    triage::AutomationGateway automation;
    triage::TriageApiServer server;
};

std::string errorKind(const nlohmann::json &response)
{
    return response.value("kind", "");
}

} // namespace

class ApiServerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testMalformedRequests();
    void testGetRegistry();
    void testForcedRefreshOnlyInManual();
    void testGetItem();
    void testSetStatus();
    void testCycleStatus();
    void testModeRoundTrip();
    void testDeleteRequiresManual();
    void testDispatchAutomation();
    void testOversizedAutomationPayload();
    void testSubscribeStream();
    void testStalledSubscriberStaysBounded();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    std::string legacyPath() const
    {
        return m_tempDir.filePath(QStringLiteral("absent.json")).toStdString();
    }
};

void ApiServerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ApiServerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ApiServerTests::testMalformedRequests()
{
    Fixture f(legacyPath());

    auto response = nlohmann::json::parse(
        f.server.handleRequestPayload("{broken").toStdString());
    QVERIFY(response.contains("error"));
    QCOMPARE(errorKind(response), std::string("validation"));

    response = nlohmann::json::parse(
        f.server.handleRequestPayload(R"({"id":3})").toStdString());
    QCOMPARE(response.value("error", ""), std::string("Missing method"));
    QCOMPARE(response.value("id", 0), 3);

    response = f.call("no_such_method");
    QCOMPARE(response.value("error", ""), std::string("Unknown method"));

    response = f.call("subscribe");
    QCOMPARE(errorKind(response), std::string("validation"));
}

void ApiServerTests::testGetRegistry()
{
    Fixture f(legacyPath());
    const auto response = f.call("get_registry");
    QVERIFY(response.contains("result"));
    QCOMPARE(response.value("id", 0), 7);

    const auto items = response["result"]["items"];
    QCOMPARE(items.size(), std::size_t(3));
    QCOMPARE(items[0].value("status", ""), std::string("Pending"));
    QCOMPARE(items[2].value("type", ""), std::string("document"));
    QVERIFY(!items[2].contains("status"));

    f.call("get_registry");
    QCOMPARE(f.provider.listCalls.load(), 1);
}

void ApiServerTests::testForcedRefreshOnlyInManual()
{
    Fixture f(legacyPath());
    f.call("get_registry");
    QCOMPARE(f.provider.listCalls.load(), 1);

    f.call("get_registry", {{"refresh", "1"}});
    QCOMPARE(f.provider.listCalls.load(), 1);

    f.statuses.setMode(triage::OperatingMode::Manual);
    auto sub = f.hub.subscribe();
    f.call("get_registry", {{"refresh", "true"}});
    QCOMPARE(f.provider.listCalls.load(), 2);
    QCOMPARE(withEvent(drain(sub), "").size(), std::size_t(1));
}

void ApiServerTests::testGetItem()
{
    Fixture f(legacyPath());
    f.provider.items.push_back(makeItem("n9", ItemKind::Note, "Late addition"));

    const auto response = f.call("get_item", {{"id", "n9"}});
    const auto result = response["result"];
    QCOMPARE(result.value("title", ""), std::string("Late addition"));
    QCOMPARE(result.value("content", ""), std::string("body of n9"));
    QCOMPARE(result.value("status", ""), std::string("Pending"));
    QCOMPARE(f.statuses.peek("n9").value_or(""), std::string("Pending"));

    const auto doc = f.call("get_item", {{"id", "d1"}})["result"];
    QVERIFY(!doc.contains("status"));
    const auto items = f.cache.read().first;
    const auto cached = std::find_if(items.begin(), items.end(),
                                     [](const triage::RegistryItem &item) {
                                         return item.id == "d1";
                                     });
    QVERIFY(cached != items.end());
    QCOMPARE(cached->snippet, std::string("Document"));

    QCOMPARE(errorKind(f.call("get_item", {{"id", "missing"}})), std::string("provider"));
    QCOMPARE(errorKind(f.call("get_item")), std::string("validation"));
}

void ApiServerTests::testSetStatus()
{
    Fixture f(legacyPath());
    f.call("get_registry");
    auto sub = f.hub.subscribe();

    const auto ok = f.call("set_status", {{"id", "n1"}, {"status", "Review"}});
    QCOMPARE(ok["result"].value("status", ""), std::string("Review"));
    QCOMPARE(f.durable.snapshot().at("n1"), std::string("Review"));

    const auto messages = drain(sub);
    const auto statusEvents = withEvent(messages, "status");
    QCOMPARE(statusEvents.size(), std::size_t(1));
    QCOMPARE(nlohmann::json::parse(statusEvents.front().data).value("title", ""),
             std::string("Standup"));
    QCOMPARE(withEvent(messages, "").size(), std::size_t(1));

    const auto bad = f.call("set_status", {{"id", "n1"}, {"status", "Done"}});
    QCOMPARE(errorKind(bad), std::string("validation"));
    QCOMPARE(f.statuses.peek("n1").value_or(""), std::string("Review"));
    QVERIFY(drain(sub).empty());

    QCOMPARE(errorKind(f.call("set_status", {{"id", ""}, {"status", "Active"}})),
             std::string("validation"));
    QCOMPARE(errorKind(f.call("set_status", {{"id", "n1"}})), std::string("validation"));
}

void ApiServerTests::testCycleStatus()
{
    Fixture f(legacyPath());
    f.call("get_registry");

    auto response = f.call("cycle_status", {{"id", "n1"}, {"direction", "forward"}});
    QCOMPARE(response["result"].value("status", ""), std::string("Execute"));
    response = f.call("cycle_status", {{"id", "n2"}, {"direction", "back"}});
    QCOMPARE(response["result"].value("status", ""), std::string("Error"));
    QCOMPARE(f.statuses.peek("n2").value_or(""), std::string("Error"));

    QCOMPARE(errorKind(f.call("cycle_status", {{"id", "n1"}, {"direction", "sideways"}})),
             std::string("validation"));

    auto sub = f.hub.subscribe();
    const int writesBefore = f.durable.statusWrites;
    QCOMPARE(errorKind(f.call("cycle_status", {{"id", "d1"}})), std::string("validation"));
    QCOMPARE(errorKind(f.call("set_status", {{"id", "d1"}, {"status", "Active"}})),
             std::string("validation"));
    QVERIFY(!f.statuses.peek("d1").has_value());
    QCOMPARE(f.durable.statusWrites, writesBefore);
    QVERIFY(f.durable.snapshot().count("d1") == 0);
    QVERIFY(drain(sub).empty());
}

void ApiServerTests::testModeRoundTrip()
{
    Fixture f(legacyPath());
    QCOMPARE(f.call("get_mode")["result"].value("mode", ""), std::string("AUTO"));

    QCOMPARE(f.call("set_mode", {{"mode", "MANUAL"}})["result"].value("mode", ""),
             std::string("MANUAL"));
    QCOMPARE(f.durable.mode.value_or(""), std::string("MANUAL"));
    QCOMPARE(f.call("get_mode")["result"].value("mode", ""), std::string("MANUAL"));

    QCOMPARE(errorKind(f.call("set_mode", {{"mode", "SEMI"}})), std::string("validation"));
    QVERIFY(f.statuses.mode() == triage::OperatingMode::Manual);
}

void ApiServerTests::testDeleteRequiresManual()
{
    Fixture f(legacyPath());
    f.call("get_registry");

    QCOMPARE(errorKind(f.call("delete_item", {{"id", "n2"}})), std::string("authorization"));
    QCOMPARE(f.provider.items.size(), std::size_t(3));

    f.statuses.setMode(triage::OperatingMode::Manual);
    auto sub = f.hub.subscribe();
    const auto ok = f.call("delete_item", {{"id", "n2"}});
    QVERIFY(ok["result"].value("ok", false));
    QCOMPARE(f.provider.items.size(), std::size_t(2));
    QVERIFY(!f.statuses.peek("n2").has_value());
    QCOMPARE(f.durable.removed, std::vector<std::string>{"n2"});
    QCOMPARE(withEvent(drain(sub), "").size(), std::size_t(1));

    QCOMPARE(errorKind(f.call("delete_item", {{"id", "n2"}})), std::string("provider"));
}

void ApiServerTests::testDispatchAutomation()
{
    Fixture f(legacyPath());
    QCOMPARE(errorKind(f.call("dispatch_automation", {{"task", "summarize"}})),
             std::string("authorization"));
    QVERIFY(f.launcher.tasks.empty());

    f.statuses.setMode(triage::OperatingMode::Manual);
    QCOMPARE(errorKind(f.call("dispatch_automation", {{"task", "  "}})),
             std::string("validation"));

    auto sub = f.hub.subscribe();
    const auto ok = f.call("dispatch_automation", {{"task", "summarize"}});
    QCOMPARE(ok["result"].value("status", ""), std::string("accepted"));
    QCOMPARE(f.launcher.tasks, std::vector<std::string>{"summarize"});
    QCOMPARE(withEvent(drain(sub), "automation").size(), std::size_t(1));

    f.launcher.fail = true;
    QCOMPARE(errorKind(f.call("dispatch_automation", {{"task", "summarize"}})),
             std::string("launch"));
}

void ApiServerTests::testOversizedAutomationPayload()
{
    Fixture f(legacyPath());
    f.statuses.setMode(triage::OperatingMode::Manual);

    const std::string task(triage::kMaxAutomationPayloadBytes + 1, 'x');
    QCOMPARE(errorKind(f.call("dispatch_automation", {{"task", task}})),
             std::string("validation"));
    QVERIFY(f.launcher.tasks.empty());
}

void ApiServerTests::testSubscribeStream()
{
    Fixture f(legacyPath());
    const QString socketPath = m_tempDir.filePath(QStringLiteral("triage.sock"));
    QVERIFY(f.server.start(socketPath));

    QLocalSocket client;
    client.connectToServer(socketPath);
    QVERIFY(client.waitForConnected(1000));
    client.write(R"({"id":1,"method":"subscribe"})");
    QVERIFY(client.waitForBytesWritten(1000));

    QByteArray received;
    const auto pump = [&client, &received]() {
        received += client.readAll();
        return received;
    };

    QTRY_VERIFY(pump().startsWith("data: ["));
    QCOMPARE(f.server.activeStreams(), std::size_t(1));
    QCOMPARE(f.hub.subscriberCount(), std::size_t(1));

    f.call("set_status", {{"id", "n1"}, {"status", "Active"}});
    QTRY_VERIFY(pump().contains("event: status\ndata: "));
    QVERIFY(received.contains("\"status\":\"Active\""));

    client.disconnectFromServer();
    QTRY_COMPARE(f.server.activeStreams(), std::size_t(0));
    QCOMPARE(f.hub.subscriberCount(), std::size_t(0));
}

void ApiServerTests::testStalledSubscriberStaysBounded()
{
    Fixture f(legacyPath());
    const qint64 limit = 64 * 1024;
    f.server.setStreamBacklogLimit(limit);
    const QString socketPath = m_tempDir.filePath(QStringLiteral("stalled.sock"));
    QVERIFY(f.server.start(socketPath));

    // Unread data backs up into the kernel once the client buffer is full.
    QLocalSocket client;
    client.setReadBufferSize(1024);
    client.connectToServer(socketPath);
    QVERIFY(client.waitForConnected(1000));
    client.write(R"({"id":1,"method":"subscribe"})");
    QVERIFY(client.waitForBytesWritten(1000));
    QTRY_COMPARE(f.server.activeStreams(), std::size_t(1));

    const nlohmann::json bulky = nlohmann::json::array({std::string(16 * 1024, 'x')});
    for (int i = 0; i < 400; ++i) {
        f.hub.publish(triage::EventKind::Snapshot, bulky);
        QTest::qWait(1);
        QVERIFY(f.server.streamBacklogBytes() <= limit);
    }

    QTRY_VERIFY(f.server.droppedStreamMessages() > 0);
    QVERIFY(f.server.streamBacklogBytes() <= limit);
    QCOMPARE(f.server.activeStreams(), std::size_t(1));

    client.abort();
    QTRY_COMPARE(f.server.activeStreams(), std::size_t(0));
    QCOMPARE(f.hub.subscriberCount(), std::size_t(0));
}

QTEST_MAIN(ApiServerTests)
#include "test_api_server.moc"
