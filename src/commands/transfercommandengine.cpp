#include "transfercommandengine.h"
#include "services/dataconnectionmanager.h"

#include <QDebug>

TransferCommandEngine::TransferCommandEngine(const ReplyTranslator &translator)
    : translator_(translator)
{
}

TransferOutcome TransferCommandEngine::execute(TransferCommand &command, FtpSession &session,
                                               const FtpRequest &request)
{
    // Declared first so the connection is released after the terminal reply,
    // on every return path
    DataConnectionGuard guard(session.dataConnection());

    const QString name = command.name();

    TransferContext context;
    context.argument = request.argument;
    context.restartOffset = session.restartOffset();
    session.resetTransientState();

    if (!session.dataConnection().isNegotiated()) {
        return finish(session, name, context,
                      TransferOutcome::preconditionFailed(
                          TransferOutcome::Precondition::SequenceNotNegotiated,
                          QStringLiteral("PORT or PASV must be issued first")));
    }

    if (std::optional<TransferOutcome> refused = command.prepare(session, context)) {
        return finish(session, name, context, *refused);
    }

    session.write(translator_.translate(FtpReply::FileStatusOk, name, QString(),
                                        ReplyContext{context.fileName(), -1}));

    QString errorString;
    IDataConnection *connection = session.dataConnection().open(&errorString);
    if (!connection) {
        return finish(session, name, context,
                      TransferOutcome::preconditionFailed(
                          TransferOutcome::Precondition::ConnectionUnavailable, errorString));
    }

    const TransferOutcome outcome = command.transfer(session, *connection, context);
    if (outcome.isSuccess()) {
        command.transferSucceeded(session, context, outcome);
    }
    return finish(session, name, context, outcome);
}

TransferOutcome TransferCommandEngine::finish(FtpSession &session, const QString &command,
                                              const TransferContext &context,
                                              const TransferOutcome &outcome) const
{
    if (!outcome.isSuccess()) {
        qDebug().noquote() << command + QLatin1Char(':') << session.identity()
                           << outcome.toString() << outcome.reason();
    }

    session.write(translator_.replyFor(outcome, command,
                                       ReplyContext{context.fileName(), outcome.bytes()}));
    return outcome;
}
