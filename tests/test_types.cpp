#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QFileInfo>

#include "ferry/Errors.hpp"
#include "ferry/FileTransfer.hpp"
#include "ferry/Types.hpp"

using namespace ferry;

class TestTypes : public QObject
{
    Q_OBJECT

private slots:
    // ========== Remote paths ==========

    void testNormalizeCollapsesSeparators()
    {
        QCOMPARE(QString::fromStdString(normalizeRemotePath("/home//user/./docs/")), QString("/home/user/docs"));
        QCOMPARE(QString::fromStdString(normalizeRemotePath("/")), QString("/"));
        QCOMPARE(QString::fromStdString(normalizeRemotePath("///")), QString("/"));
    }

    void testNormalizeResolvesParent()
    {
        QCOMPARE(QString::fromStdString(normalizeRemotePath("/a/b/../c")), QString("/a/c"));
        // Never climbs above the root
        QCOMPARE(QString::fromStdString(normalizeRemotePath("/../../etc")), QString("/etc"));
        // Relative paths keep leading ".."
        QCOMPARE(QString::fromStdString(normalizeRemotePath("../x")), QString("../x"));
        QCOMPARE(QString::fromStdString(normalizeRemotePath("a/..")), QString("."));
    }

    void testJoinAndParent()
    {
        QCOMPARE(QString::fromStdString(joinRemotePath("/srv", "f.txt")), QString("/srv/f.txt"));
        QCOMPARE(QString::fromStdString(joinRemotePath("/", "f.txt")), QString("/f.txt"));
        QCOMPARE(QString::fromStdString(joinRemotePath("", "f.txt")), QString("f.txt"));

        QCOMPARE(QString::fromStdString(remoteParent("/srv/data/f.txt")), QString("/srv/data"));
        QCOMPARE(QString::fromStdString(remoteParent("/f.txt")), QString("/"));
        QCOMPARE(QString::fromStdString(remoteParent("f.txt")), QString());
    }

    // ========== Permission strings ==========

    void testPermissionString()
    {
        QCOMPARE(QString::fromStdString(permissionString(0040755)), QString("drwxr-xr-x"));
        QCOMPARE(QString::fromStdString(permissionString(0100644)), QString("-rw-r--r--"));
        QCOMPARE(QString::fromStdString(permissionString(0120777)), QString("lrwxrwxrwx"));
        QCOMPARE(QString::fromStdString(permissionString(0104755)), QString("-rwsr-xr-x"));
        QCOMPARE(QString::fromStdString(permissionString(0041777)), QString("drwxrwxrwt"));
    }

    // ========== Error classification ==========

    void testTransferKindFromErrno()
    {
        QCOMPARE(transferKindFromErrno(ENOSPC), TransferErrorKind::DiskFull);
        QCOMPARE(transferKindFromErrno(EACCES), TransferErrorKind::PermissionDenied);
        QCOMPARE(transferKindFromErrno(ENOENT), TransferErrorKind::SourceNotFound);
        QCOMPARE(transferKindFromErrno(EIO), TransferErrorKind::IoError);
    }

    void testDestinationKindFromErrno()
    {
        QCOMPARE(destinationKindFromErrno(ENOENT), TransferErrorKind::IoError);
        QCOMPARE(destinationKindFromErrno(ENOTDIR), TransferErrorKind::DestinationConflict);
        QCOMPARE(destinationKindFromErrno(ENOSPC), TransferErrorKind::DiskFull);
        QCOMPARE(destinationKindFromErrno(EROFS), TransferErrorKind::PermissionDenied);
    }

    void testLocalDestinationUnderRegularFile()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QFile blocker(dir.path() + "/blocker");
        QVERIFY(blocker.open(QIODevice::WriteOnly));
        blocker.close();

        TransferError err;
        QVERIFY(!prepareLocalDestination((dir.path() + "/blocker/sub/out.bin").toStdString(), err));
        QCOMPARE(err.kind, TransferErrorKind::DestinationConflict);

        QVERIFY(prepareLocalDestination((dir.path() + "/fresh/sub/out.bin").toStdString(), err));
        QVERIFY(QFileInfo(dir.path() + "/fresh/sub").isDir());
    }

    void testKindsFromToolText()
    {
        QCOMPARE(transferKindFromToolText("scp: /srv/x: No such file or directory"), TransferErrorKind::SourceNotFound);
        QCOMPARE(transferKindFromToolText("scp: /srv/x: Permission denied"), TransferErrorKind::PermissionDenied);
        QCOMPARE(transferKindFromToolText("write: No space left on device"), TransferErrorKind::DiskFull);
        QCOMPARE(transferKindFromToolText("Disk quota exceeded"), TransferErrorKind::RemoteQuotaExceeded);
        QCOMPARE(transferKindFromToolText("something odd"), TransferErrorKind::IoError);

        QCOMPARE(listKindFromToolText("ls: cannot access '/x': No such file or directory"), ListErrorKind::PathNotFound);
        QCOMPARE(listKindFromToolText("ls: cannot open directory '/root': Permission denied"), ListErrorKind::PermissionDenied);
    }

    void testConnectErrorMessageMentionsBothModes()
    {
        ConnectError err;
        err.kind = ConnectErrorKind::AllAuthMethodsExhausted;
        err.libraryError = "password: Authentication failed";
        err.nativeError = "password: Permission denied";
        const QString msg = QString::fromStdString(err.message());
        QVERIFY(msg.contains("Authentication failed"));
        QVERIFY(msg.contains("Permission denied"));
        QVERIFY(!err.ok());
    }
};

QTEST_GUILESS_MAIN(TestTypes)
#include "test_types.moc"
