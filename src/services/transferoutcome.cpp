#include "transferoutcome.h"

TransferOutcome TransferOutcome::success(qint64 bytes)
{
    return TransferOutcome(Kind::Success, Precondition::None, bytes, QString());
}

TransferOutcome TransferOutcome::connectionAborted(const QString &reason)
{
    return TransferOutcome(Kind::ConnectionAborted, Precondition::None, 0, reason);
}

TransferOutcome TransferOutcome::ioFailure(const QString &reason)
{
    return TransferOutcome(Kind::IoFailure, Precondition::None, 0, reason);
}

TransferOutcome TransferOutcome::syntaxError(const QString &reason)
{
    return TransferOutcome(Kind::SyntaxError, Precondition::None, 0, reason);
}

TransferOutcome TransferOutcome::preconditionFailed(Precondition precondition, const QString &reason)
{
    return TransferOutcome(Kind::PreconditionFailed, precondition, 0, reason);
}

QString TransferOutcome::toString() const
{
    switch (kind_) {
    case Kind::Success:
        return QStringLiteral("Success(%1)").arg(bytes_);
    case Kind::ConnectionAborted:
        return QStringLiteral("ConnectionAborted");
    case Kind::IoFailure:
        return QStringLiteral("IoFailure");
    case Kind::SyntaxError:
        return QStringLiteral("SyntaxError");
    case Kind::PreconditionFailed:
        break;
    }

    switch (precondition_) {
    case Precondition::SequenceNotNegotiated:
        return QStringLiteral("PreconditionFailed(SequenceNotNegotiated)");
    case Precondition::ConnectionUnavailable:
        return QStringLiteral("PreconditionFailed(ConnectionUnavailable)");
    case Precondition::ResourceUnavailable:
        return QStringLiteral("PreconditionFailed(ResourceUnavailable)");
    case Precondition::PermissionDenied:
        return QStringLiteral("PreconditionFailed(PermissionDenied)");
    case Precondition::None:
        break;
    }
    return QStringLiteral("PreconditionFailed");
}
