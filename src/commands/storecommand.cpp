#include "storecommand.h"

#include <QDebug>
#include <QFileDevice>

StoreCommand::StoreCommand(IFtpStatistics *statistics)
    : statistics_(statistics)
{
}

std::optional<TransferOutcome> StoreCommand::prepare(FtpSession &session, TransferContext &context)
{
    const QString path = context.argument.trimmed();
    if (path.isEmpty()) {
        return TransferOutcome::syntaxError(QStringLiteral("File name required"));
    }

    context.target = session.fileSystemView().resolve(path);
    if (!context.target) {
        return TransferOutcome::preconditionFailed(TransferOutcome::Precondition::ResourceUnavailable,
                                                   QStringLiteral("Cannot resolve %1").arg(path));
    }
    if (context.target->isDirectory()) {
        return TransferOutcome::preconditionFailed(TransferOutcome::Precondition::ResourceUnavailable,
                                                   QStringLiteral("%1 is a directory")
                                                       .arg(context.target->fullName()));
    }
    return checkWritable(*context.target);
}

TransferOutcome StoreCommand::transfer(FtpSession &session, IDataConnection &connection,
                                       TransferContext &context)
{
    std::unique_ptr<QIODevice> sink = context.target->createOutputStream(context.restartOffset);
    if (!sink) {
        return TransferOutcome::ioFailure(QStringLiteral("Cannot open %1 for writing")
                                              .arg(context.target->fullName()));
    }

    TransferOutcome outcome = connection.transferFromClient(*sink, session.transferType());
    if (outcome.isSuccess()) {
        // Buffered file devices only report write errors when flushed
        auto *file = qobject_cast<QFileDevice *>(sink.get());
        if (file && !file->flush()) {
            outcome = TransferOutcome::ioFailure(QStringLiteral("Cannot write %1: %2")
                                                     .arg(context.target->fullName(), file->errorString()))
                          .withBytes(outcome.bytes());
        }
    }
    sink->close();
    return outcome;
}

void StoreCommand::transferSucceeded(FtpSession &session, const TransferContext &context,
                                     const TransferOutcome &outcome)
{
    qInfo().noquote() << name() + QLatin1Char(':') << "File upload:" << session.identity() << "-"
                      << context.target->fullName();

    if (statistics_) {
        statistics_->recordUpload(session, *context.target, outcome.bytes());
    }
}

std::optional<TransferOutcome> StoreCommand::checkWritable(const FtpFile &target)
{
    if (!target.hasWritePermission()) {
        return TransferOutcome::preconditionFailed(TransferOutcome::Precondition::PermissionDenied,
                                                   QStringLiteral("No write permission for %1")
                                                       .arg(target.fullName()));
    }
    return std::nullopt;
}

std::optional<TransferOutcome> StoreUniqueCommand::prepare(FtpSession &session, TransferContext &context)
{
    context.target = session.uniqueNames().uniqueIn(session.fileSystemView(), context.argument.trimmed());
    if (!context.target) {
        return TransferOutcome::preconditionFailed(TransferOutcome::Precondition::ResourceUnavailable,
                                                   QStringLiteral("No unique name for '%1'")
                                                       .arg(context.argument));
    }

    // A unique name never continues an earlier upload
    context.restartOffset = 0;
    return checkWritable(*context.target);
}
