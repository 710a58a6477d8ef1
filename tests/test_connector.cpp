#include <QtTest>

#include "ferry/Connector.hpp"
#include "ferry/MockFileTransfer.hpp"

using namespace ferry;
using Kind = AuthMethod::Kind;

class TestConnector : public QObject
{
    Q_OBJECT

private:
    std::shared_ptr<MockFileTransfer::Script> library;
    std::shared_ptr<MockFileTransfer::Script> native;
    int libraryCreated = 0;
    int nativeCreated = 0;

    TransferFactory factory()
    {
        return [this](TransportMode mode) -> std::unique_ptr<FileTransfer> {
            if (mode == TransportMode::Library) {
                ++libraryCreated;
                return std::make_unique<MockFileTransfer>(mode, library);
            }
            ++nativeCreated;
            return std::make_unique<MockFileTransfer>(mode, native);
        };
    }

    static ServerProfile profile()
    {
        ServerProfile p;
        p.host = "files.example.net";
        p.username = "deploy";
        p.password = "pw";
        return p;
    }

    static AuthChain passwordThenDefaultKeys()
    {
        return {AuthMethod::password(), AuthMethod::defaultKeyProbe({}, std::nullopt)};
    }

    static QStringList toList(const std::vector<std::string>& v)
    {
        QStringList out;
        for (const auto& s : v) out << QString::fromStdString(s);
        return out;
    }

private slots:
    void init()
    {
        library = std::make_shared<MockFileTransfer::Script>();
        native = std::make_shared<MockFileTransfer::Script>();
        libraryCreated = nativeCreated = 0;
    }

    // ========== Library mode ==========

    void testLibraryModeBindsFirst()
    {
        library->acceptedAuth = {Kind::Password};
        native->acceptedAuth = {Kind::Password};

        Connector c(TransportOptions(), factory());
        ConnectError err;
        auto conn = c.connect(profile(), passwordThenDefaultKeys(), err);
        QVERIFY(conn);
        QVERIFY(err.ok());
        QCOMPARE(conn->mode(), TransportMode::Library);
        QCOMPARE(conn->authMethod().kind, Kind::Password);
        // Native mode never touched
        QCOMPARE(nativeCreated, 0);
        QVERIFY(native->logSnapshot().empty());
    }

    void testChainStopsAtFirstSuccess()
    {
        library->acceptedAuth = {Kind::DefaultKeyProbe};
        Connector c(TransportOptions(), factory());
        ConnectError err;
        auto conn = c.connect(profile(), passwordThenDefaultKeys(), err);
        QVERIFY(conn);
        QCOMPARE(conn->authMethod().kind, Kind::DefaultKeyProbe);
        QCOMPARE(toList(library->logSnapshot()),
                 QStringList({"library:open", "library:auth:password:fail", "library:auth:default-keys:ok"}));
    }

    // ========== Fallback ==========

    void testFallsBackToNativeAfterLibraryExhausted()
    {
        library->acceptedAuth = {};
        native->acceptedAuth = {Kind::Password};

        Connector c(TransportOptions(), factory());
        ConnectError err;
        auto conn = c.connect(profile(), passwordThenDefaultKeys(), err);
        QVERIFY(conn);
        QCOMPARE(conn->mode(), TransportMode::NativeTool);

        // Every library method was tried before native mode started
        QCOMPARE(toList(library->logSnapshot()),
                 QStringList({"library:open", "library:auth:password:fail", "library:auth:default-keys:fail",
                              "library:disconnect"}));
        QCOMPARE(toList(native->logSnapshot()), QStringList({"native:open", "native:auth:password:ok"}));
    }

    void testFallsBackWhenLibraryTransportFails()
    {
        library->openOk = false;
        library->openErrorKind = ConnectErrorKind::TransportUnavailable;
        native->acceptedAuth = {Kind::DefaultKeyProbe};

        Connector c(TransportOptions(), factory());
        ConnectError err;
        auto conn = c.connect(profile(), passwordThenDefaultKeys(), err);
        QVERIFY(conn);
        QCOMPARE(conn->mode(), TransportMode::NativeTool);
        QCOMPARE(conn->authMethod().kind, Kind::DefaultKeyProbe);
    }

    void testAllMethodsExhaustedInBothModes()
    {
        Connector c(TransportOptions(), factory());
        ConnectError err;
        auto conn = c.connect(profile(), passwordThenDefaultKeys(), err);
        QVERIFY(!conn);
        QCOMPARE(err.kind, ConnectErrorKind::AllAuthMethodsExhausted);
        // Only the last error of each mode is reported
        QCOMPARE(QString::fromStdString(err.libraryError), QString("default-keys[]: mock: default-keys rejected"));
        QCOMPARE(QString::fromStdString(err.nativeError), QString("default-keys[]: mock: default-keys rejected"));
        QCOMPARE(QString::fromStdString(native->logSnapshot().back()), QString("native:disconnect"));
    }

    void testNetworkFailureIsReportedAsIs()
    {
        library->openOk = false;
        library->openErrorKind = ConnectErrorKind::NetworkUnreachable;
        native->openOk = false;
        native->openErrorKind = ConnectErrorKind::NetworkUnreachable;

        Connector c(TransportOptions(), factory());
        ConnectError err;
        QVERIFY(!c.connect(profile(), passwordThenDefaultKeys(), err));
        QCOMPARE(err.kind, ConnectErrorKind::NetworkUnreachable);
        QVERIFY(!err.libraryError.empty());
        QVERIFY(!err.nativeError.empty());
    }

    void testHostKeyRejectionStillTriesNative()
    {
        library->openOk = false;
        library->openErrorKind = ConnectErrorKind::HostKeyRejected;
        library->openError = "host key mismatch";
        native->openOk = false;
        native->openErrorKind = ConnectErrorKind::HostKeyRejected;

        Connector c(TransportOptions(), factory());
        ConnectError err;
        QVERIFY(!c.connect(profile(), passwordThenDefaultKeys(), err));
        QCOMPARE(err.kind, ConnectErrorKind::HostKeyRejected);
        QCOMPARE(nativeCreated, 1);
    }

    void testOneModeUpMeansAuthExhausted()
    {
        // Library unreachable, native reachable but rejects everything
        library->openOk = false;
        Connector c(TransportOptions(), factory());
        ConnectError err;
        QVERIFY(!c.connect(profile(), passwordThenDefaultKeys(), err));
        QCOMPARE(err.kind, ConnectErrorKind::AllAuthMethodsExhausted);
    }

    // ========== Session handling ==========

    void testSessionReopenedAfterServerDrop()
    {
        library->loseSessionOnAuthFailure = true;
        library->acceptedAuth = {Kind::DefaultKeyProbe};

        Connector c(TransportOptions(), factory());
        ConnectError err;
        auto conn = c.connect(profile(), passwordThenDefaultKeys(), err);
        QVERIFY(conn);
        QCOMPARE(conn->mode(), TransportMode::Library);
        QCOMPARE(libraryCreated, 2);
        QCOMPARE(toList(library->logSnapshot()),
                 QStringList({"library:open", "library:auth:password:fail",
                              "library:open", "library:auth:default-keys:ok"}));
    }

    void testConnectionDisconnectsOnDestruction()
    {
        library->acceptedAuth = {Kind::Password};
        Connector c(TransportOptions(), factory());
        ConnectError err;
        {
            auto conn = c.connect(profile(), passwordThenDefaultKeys(), err);
            QVERIFY(conn);
            QVERIFY(conn->transfer().isConnected());
        }
        QCOMPARE(QString::fromStdString(library->logSnapshot().back()), QString("library:disconnect"));
    }

    void testResolvePathUsesBase()
    {
        library->acceptedAuth = {Kind::Password};
        ServerProfile p = profile();
        p.remote_base_path = "/srv/www/";
        Connector c(TransportOptions(), factory());
        ConnectError err;
        auto conn = c.connect(p, passwordThenDefaultKeys(), err);
        QVERIFY(conn);
        QCOMPARE(QString::fromStdString(conn->resolvePath("")), QString("/srv/www"));
        QCOMPARE(QString::fromStdString(conn->resolvePath("img/a.png")), QString("/srv/www/img/a.png"));
        QCOMPARE(QString::fromStdString(conn->resolvePath("../etc")), QString("/srv/etc"));
        QCOMPARE(QString::fromStdString(conn->resolvePath("/tmp//x")), QString("/tmp/x"));
    }
};

QTEST_GUILESS_MAIN(TestConnector)
#include "test_connector.moc"
