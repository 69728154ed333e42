/**
 * @file test_transfercommandengine.cpp
 * @brief Unit tests for TransferCommandEngine with the LIST, NLST, STOR and STOU commands.
 *
 * Tests verify:
 * - 503 without PORT/PASV, with no 150 and no data connection
 * - 150 followed by exactly one terminal reply, in order
 * - The data connection is opened at most once and closed exactly once
 * - 550 checks run before anything is announced
 * - Transport failures map to 425, 426 and 551
 */

#include <QtTest/QtTest>
#include <QHostAddress>
#include <QTemporaryDir>

#include "mocks/mockdatatransport.h"
#include "mocks/mockfilesystemview.h"
#include "mocks/mockreplychannel.h"
#include "commands/listcommand.h"
#include "commands/storecommand.h"
#include "commands/transfercommandengine.h"
#include "models/ftpsession.h"
#include "services/nativefilesystemview.h"
#include "services/replytranslator.h"
#include "services/serverstatistics.h"

class TestTransferCommandEngine : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Sequencing
    void testListWithoutDescriptorReplies503();
    void testStouWithoutDescriptorReplies503();
    void testDescriptorIsSingleUse();
    void testTransientStateResetKeepsDescriptor();

    // Listing
    void testListEmptyDirectory();
    void testListSendsVisibleEntries();
    void testListShowsHiddenWithOption();
    void testListWildcardInDirectoryReplies501();
    void testListTransportAbortReplies426();
    void testNlstSendsNamesOnly();
    void testNlstLongOptionUsesListFormat();

    // Unique store
    void testStouPermissionDeniedReplies550();
    void testStouAcceptFailureReplies425();
    void testStouSocketResetReplies426();
    void testStouStoresUnderUniqueName();
    void testStouUnresolvablePathReplies550();
    void testStouIgnoresRestartOffset();

    // Store
    void testStorWithoutArgumentReplies501();
    void testStorHonoursRestartOffset();
    void testStorRestartBeyondEndZeroFills();
    void testStorOutputStreamFailureReplies551();
    void testStorDeferredWriteFailureReplies551();
    void testStorToFullDeviceReplies551();
    void testStorPassesTransferType();
    void testUploadRecordsStatistics();
    void testFailedUploadRecordsNoStatistics();

private:
    void negotiate();

    MockDataTransport *transport_ = nullptr;
    MockReplyChannel *replies_ = nullptr;
    MockFileSystemView *view_ = nullptr;
    FtpSession *session_ = nullptr;
    ReplyTranslator *translator_ = nullptr;
    TransferCommandEngine *engine_ = nullptr;
};

void TestTransferCommandEngine::init()
{
    transport_ = new MockDataTransport();
    replies_ = new MockReplyChannel();
    view_ = new MockFileSystemView();
    session_ = new FtpSession("alice", std::unique_ptr<IFileSystemView>(view_), *transport_, *replies_);
    translator_ = new ReplyTranslator();
    engine_ = new TransferCommandEngine(*translator_);
}

void TestTransferCommandEngine::cleanup()
{
    delete engine_;
    engine_ = nullptr;
    delete translator_;
    translator_ = nullptr;
    // The session owns the view and must go before the transport
    delete session_;
    session_ = nullptr;
    view_ = nullptr;
    delete replies_;
    replies_ = nullptr;
    delete transport_;
    transport_ = nullptr;
}

void TestTransferCommandEngine::negotiate()
{
    session_->setDataDescriptor(DataConnectionDescriptor::active(QHostAddress(QHostAddress::LocalHost), 2121));
}

// Sequencing

void TestTransferCommandEngine::testListWithoutDescriptorReplies503()
{
    ListCommand list;
    TransferOutcome outcome = engine_->execute(list, *session_, FtpRequest("LIST"));

    QCOMPARE(outcome.precondition(), TransferOutcome::Precondition::SequenceNotNegotiated);
    QCOMPARE(replies_->codes(), QList<int>({503}));
    QCOMPARE(replies_->last().text, QString("PORT or PASV must be issued first."));
    QCOMPARE(transport_->mockOpenCount(), 0);
}

void TestTransferCommandEngine::testStouWithoutDescriptorReplies503()
{
    StoreUniqueCommand stou;
    engine_->execute(stou, *session_, FtpRequest("STOU"));

    QCOMPARE(replies_->codes(), QList<int>({503}));
    QCOMPARE(transport_->mockOpenCount(), 0);
    // Nothing was resolved or created
    QCOMPARE(view_->childrenOf("/").size(), 0);
}

void TestTransferCommandEngine::testDescriptorIsSingleUse()
{
    ListCommand list;
    negotiate();
    engine_->execute(list, *session_, FtpRequest("LIST"));
    engine_->execute(list, *session_, FtpRequest("LIST"));

    QCOMPARE(replies_->codes(), QList<int>({150, 226, 503}));
    QCOMPARE(transport_->mockOpenCount(), 1);
    QVERIFY(!session_->currentDataDescriptor().has_value());
}

void TestTransferCommandEngine::testTransientStateResetKeepsDescriptor()
{
    ListCommand list;
    negotiate();
    session_->setRestartOffset(100);
    session_->setRenameFrom("/old.txt");
    transport_->mockSetOpenFails(true);

    engine_->execute(list, *session_, FtpRequest("LIST"));

    // Descriptor survived the reset long enough to attempt the open
    QCOMPARE(transport_->mockOpenCount(), 1);
    QCOMPARE(session_->restartOffset(), qint64(0));
    QVERIFY(!session_->renameFrom().has_value());
}

// Listing

void TestTransferCommandEngine::testListEmptyDirectory()
{
    ListCommand list;
    negotiate();
    TransferOutcome outcome = engine_->execute(list, *session_, FtpRequest("LIST"));

    QVERIFY(outcome.isSuccess());
    QCOMPARE(outcome.bytes(), qint64(0));
    QCOMPARE(replies_->codes(), QList<int>({150, 226}));
    QVERIFY(transport_->mockSentData().isEmpty());
    QCOMPARE(transport_->mockOpenCount(), 1);
    QCOMPARE(transport_->mockCloseCount(), 1);
    QCOMPARE(transport_->mockLiveConnections(), 0);
}

void TestTransferCommandEngine::testListSendsVisibleEntries()
{
    view_->mockAddFile("/a.txt", "xyz");
    view_->mockAddFile("/.profile", "hidden");
    view_->mockAddDirectory("/docs");

    ListCommand list;
    negotiate();
    engine_->execute(list, *session_, FtpRequest("LIST"));

    const QByteArray sent = transport_->mockSentData();
    QCOMPARE(sent.count("\r\n"), 2);
    QVERIFY(sent.contains(" a.txt\r\n"));
    QVERIFY(sent.contains(" docs\r\n"));
    QVERIFY(!sent.contains(".profile"));
    QVERIFY(sent.startsWith("-rw-------   1 user group            3 "));
    QCOMPARE(replies_->codes(), QList<int>({150, 226}));
}

void TestTransferCommandEngine::testListShowsHiddenWithOption()
{
    view_->mockAddFile("/a.txt", "xyz");
    view_->mockAddFile("/.profile", "hidden");

    ListCommand list;
    negotiate();
    engine_->execute(list, *session_, FtpRequest("LIST", "-a"));

    const QByteArray sent = transport_->mockSentData();
    QCOMPARE(sent.count("\r\n"), 2);
    QVERIFY(sent.contains(" .profile\r\n"));
}

void TestTransferCommandEngine::testListWildcardInDirectoryReplies501()
{
    ListCommand list;
    negotiate();
    TransferOutcome outcome = engine_->execute(list, *session_, FtpRequest("LIST", "s*c/readme"));

    QCOMPARE(outcome.kind(), TransferOutcome::Kind::SyntaxError);
    QCOMPARE(replies_->codes(), QList<int>({150, 501}));
    QCOMPARE(transport_->mockOpenCount(), 1);
    QCOMPARE(transport_->mockCloseCount(), 1);
    QVERIFY(transport_->mockSentData().isEmpty());
}

void TestTransferCommandEngine::testListTransportAbortReplies426()
{
    view_->mockAddFile("/a.txt", "xyz");
    transport_->mockSetTransferFailure(TransferOutcome::connectionAborted("reset by peer"));

    ListCommand list;
    negotiate();
    engine_->execute(list, *session_, FtpRequest("LIST"));

    QCOMPARE(replies_->codes(), QList<int>({150, 426}));
    QCOMPARE(transport_->mockCloseCount(), 1);
}

void TestTransferCommandEngine::testNlstSendsNamesOnly()
{
    view_->mockAddFile("/b.txt");
    view_->mockAddFile("/a.txt");

    NlstCommand nlst;
    negotiate();
    engine_->execute(nlst, *session_, FtpRequest("NLST"));

    QCOMPARE(transport_->mockSentData(), QByteArray("a.txt\r\nb.txt\r\n"));
    QCOMPARE(replies_->codes(), QList<int>({150, 226}));
}

void TestTransferCommandEngine::testNlstLongOptionUsesListFormat()
{
    view_->mockAddFile("/a.txt");

    NlstCommand nlst;
    negotiate();
    engine_->execute(nlst, *session_, FtpRequest("NLST", "-l"));

    QVERIFY(transport_->mockSentData().startsWith("-rw-------"));
}

// Unique store

void TestTransferCommandEngine::testStouPermissionDeniedReplies550()
{
    view_->mockAddDirectory("/incoming", false);

    StoreUniqueCommand stou;
    negotiate();
    TransferOutcome outcome = engine_->execute(stou, *session_, FtpRequest("STOU", "/incoming"));

    QCOMPARE(outcome.precondition(), TransferOutcome::Precondition::PermissionDenied);
    QCOMPARE(replies_->codes(), QList<int>({550}));
    QCOMPARE(replies_->last().text, QString("Permission denied: /incoming/ftp.dat."));
    QCOMPARE(transport_->mockOpenCount(), 0);
}

void TestTransferCommandEngine::testStouAcceptFailureReplies425()
{
    transport_->mockSetOpenFails(true);

    StoreUniqueCommand stou;
    negotiate();
    engine_->execute(stou, *session_, FtpRequest("STOU"));

    QCOMPARE(replies_->codes(), QList<int>({150, 425}));
    QVERIFY(!session_->dataConnection().isOpen());
    QCOMPARE(transport_->mockLiveConnections(), 0);
    QCOMPARE(transport_->mockUploadCount(), 0);
}

void TestTransferCommandEngine::testStouSocketResetReplies426()
{
    transport_->mockSetUploadData("0123456789");
    transport_->mockSetTransferFailure(TransferOutcome::connectionAborted("connection reset"), 4);

    StoreUniqueCommand stou;
    negotiate();
    TransferOutcome outcome = engine_->execute(stou, *session_, FtpRequest("STOU"));

    QCOMPARE(outcome.kind(), TransferOutcome::Kind::ConnectionAborted);
    QCOMPARE(replies_->codes(), QList<int>({150, 426}));
    QCOMPARE(transport_->mockCloseCount(), 1);

    // The partial upload is left as written
    auto stored = view_->mockEntry("/ftp.dat");
    QVERIFY(stored);
    QCOMPARE(stored->mockContent(), QByteArray("0123"));
}

void TestTransferCommandEngine::testStouStoresUnderUniqueName()
{
    view_->mockAddFile("/ftp.dat", "existing");
    transport_->mockSetUploadData("fresh");

    StoreUniqueCommand stou;
    negotiate();
    engine_->execute(stou, *session_, FtpRequest("STOU"));

    QCOMPARE(replies_->codes(), QList<int>({150, 226}));
    QVERIFY(replies_->replies().first().text.startsWith("FILE: /ftp.dat."));

    const QString storedName = replies_->replies().first().text.mid(QString("FILE: ").length());
    auto stored = view_->mockEntry(storedName);
    QVERIFY(stored);
    QCOMPARE(stored->mockContent(), QByteArray("fresh"));
    QCOMPARE(view_->mockEntry("/ftp.dat")->mockContent(), QByteArray("existing"));
    QVERIFY(replies_->last().text.contains(storedName));
}

void TestTransferCommandEngine::testStouUnresolvablePathReplies550()
{
    view_->mockSetUnresolvable("/bad");

    StoreUniqueCommand stou;
    negotiate();
    TransferOutcome outcome = engine_->execute(stou, *session_, FtpRequest("STOU", "/bad"));

    QCOMPARE(outcome.precondition(), TransferOutcome::Precondition::ResourceUnavailable);
    QCOMPARE(replies_->codes(), QList<int>({550}));
    QCOMPARE(replies_->last().text,
             QString("Requested action not taken: cannot create a unique file name."));
    QCOMPARE(transport_->mockOpenCount(), 0);
}

void TestTransferCommandEngine::testStouIgnoresRestartOffset()
{
    transport_->mockSetUploadData("data");
    session_->setRestartOffset(10);

    StoreUniqueCommand stou;
    negotiate();
    engine_->execute(stou, *session_, FtpRequest("STOU", "upload.bin"));

    auto stored = view_->mockEntry("/upload.bin");
    QVERIFY(stored);
    QCOMPARE(stored->mockOutputOffsets(), QList<qint64>({0}));
}

// Store

void TestTransferCommandEngine::testStorWithoutArgumentReplies501()
{
    StoreCommand stor;
    negotiate();
    engine_->execute(stor, *session_, FtpRequest("STOR"));

    QCOMPARE(replies_->codes(), QList<int>({501}));
    QCOMPARE(transport_->mockOpenCount(), 0);
}

void TestTransferCommandEngine::testStorHonoursRestartOffset()
{
    auto file = view_->mockAddFile("/data.bin", "ABCDEFGH");
    transport_->mockSetUploadData("xyz");
    session_->setRestartOffset(4);

    StoreCommand stor;
    negotiate();
    engine_->execute(stor, *session_, FtpRequest("STOR", "data.bin"));

    QCOMPARE(replies_->codes(), QList<int>({150, 226}));
    QCOMPARE(file->mockOutputOffsets(), QList<qint64>({4}));
    QCOMPARE(file->mockContent(), QByteArray("ABCDxyz"));
    QCOMPARE(session_->restartOffset(), qint64(0));
}

void TestTransferCommandEngine::testStorRestartBeyondEndZeroFills()
{
    auto file = view_->mockAddFile("/short.bin", "AB");
    transport_->mockSetUploadData("xy");
    session_->setRestartOffset(5);

    StoreCommand stor;
    negotiate();
    engine_->execute(stor, *session_, FtpRequest("STOR", "short.bin"));

    QCOMPARE(replies_->codes(), QList<int>({150, 226}));
    QCOMPARE(file->mockContent(), QByteArray("AB\0\0\0xy", 7));
}

void TestTransferCommandEngine::testStorOutputStreamFailureReplies551()
{
    auto file = view_->mockAddFile("/locked.bin");
    file->mockSetOutputStreamFails(true);

    StoreCommand stor;
    negotiate();
    TransferOutcome outcome = engine_->execute(stor, *session_, FtpRequest("STOR", "/locked.bin"));

    QCOMPARE(outcome.kind(), TransferOutcome::Kind::IoFailure);
    QCOMPARE(replies_->codes(), QList<int>({150, 551}));
    QCOMPARE(transport_->mockCloseCount(), 1);
}

void TestTransferCommandEngine::testStorDeferredWriteFailureReplies551()
{
    if (!QFile::exists("/dev/full")) {
        QSKIP("/dev/full is not available");
    }

    // Buffered writes to /dev/full succeed, the flush fails with ENOSPC
    ServerStatistics statistics;
    auto file = view_->mockAddFile("/full.bin");
    file->mockSetOutputFile("/dev/full");
    transport_->mockSetUploadData("hello");

    StoreCommand stor(&statistics);
    negotiate();
    TransferOutcome outcome = engine_->execute(stor, *session_, FtpRequest("STOR", "full.bin"));

    QCOMPARE(outcome.kind(), TransferOutcome::Kind::IoFailure);
    QCOMPARE(outcome.bytes(), qint64(5));
    QCOMPARE(replies_->codes(), QList<int>({150, 551}));
    QCOMPARE(statistics.totalUploadCount(), qint64(0));
    QCOMPARE(transport_->mockCloseCount(), 1);
}

void TestTransferCommandEngine::testStorToFullDeviceReplies551()
{
    if (!QFile::exists("/dev/full")) {
        QSKIP("/dev/full is not available");
    }

    QTemporaryDir root;
    QVERIFY(root.isValid());
    QVERIFY(QFile::link("/dev/full", root.filePath("full")));

    FtpSession session("alice", std::make_unique<NativeFileSystemView>(root.path()),
                       *transport_, *replies_);
    session.setDataDescriptor(DataConnectionDescriptor::active(QHostAddress(QHostAddress::LocalHost), 2121));
    transport_->mockSetUploadData("hello");

    ServerStatistics statistics;
    StoreCommand stor(&statistics);
    TransferOutcome outcome = engine_->execute(stor, session, FtpRequest("STOR", "/full"));

    QCOMPARE(outcome.kind(), TransferOutcome::Kind::IoFailure);
    QCOMPARE(replies_->codes(), QList<int>({150, 551}));
    QCOMPARE(statistics.totalUploadCount(), qint64(0));
}

void TestTransferCommandEngine::testStorPassesTransferType()
{
    transport_->mockSetUploadData("bytes");
    session_->setTransferType(TransferType::Binary);

    StoreCommand stor;
    negotiate();
    engine_->execute(stor, *session_, FtpRequest("STOR", "image.bin"));

    QCOMPARE(transport_->mockUploadCount(), 1);
    QVERIFY(transport_->mockLastUploadType() == TransferType::Binary);
}

void TestTransferCommandEngine::testUploadRecordsStatistics()
{
    ServerStatistics statistics;
    QSignalSpy spy(&statistics, &ServerStatistics::uploadRecorded);
    transport_->mockSetUploadData("hello");

    StoreCommand stor(&statistics);
    negotiate();
    engine_->execute(stor, *session_, FtpRequest("STOR", "up.txt"));

    QCOMPARE(replies_->codes(), QList<int>({150, 226}));
    QCOMPARE(replies_->last().text, QString("Transfer complete for file /up.txt (5 bytes)."));
    QCOMPARE(statistics.totalUploadCount(), qint64(1));
    QCOMPARE(statistics.totalUploadBytes(), qint64(5));
    QCOMPARE(statistics.uploadCountFor("alice"), qint64(1));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.first().at(1).toString(), QString("/up.txt"));
}

void TestTransferCommandEngine::testFailedUploadRecordsNoStatistics()
{
    ServerStatistics statistics;
    transport_->mockSetTransferFailure(TransferOutcome::ioFailure("disk full"));

    StoreCommand stor(&statistics);
    negotiate();
    engine_->execute(stor, *session_, FtpRequest("STOR", "up.txt"));

    QCOMPARE(replies_->codes(), QList<int>({150, 551}));
    QCOMPARE(statistics.totalUploadCount(), qint64(0));
}

QTEST_MAIN(TestTransferCommandEngine)
#include "test_transfercommandengine.moc"
