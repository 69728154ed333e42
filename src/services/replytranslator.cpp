#include "replytranslator.h"

#include <QStringList>

ReplyTranslator::ReplyTranslator()
{
    messages_ = {
        {"150", "File status okay; about to open data connection."},
        {"150.STOU", "FILE: {file}"},
        {"226", "Closing data connection."},
        {"226.STOR", "Transfer complete for file {file} ({bytes} bytes)."},
        {"226.STOU", "Transfer complete for file {file} ({bytes} bytes)."},
        {"425", "Can't open data connection."},
        {"426", "Connection closed; transfer aborted."},
        {"501", "Syntax error in parameters or arguments."},
        {"501.STOR", "Syntax error: file name required."},
        {"503", "Bad sequence of commands."},
        {"503.sequence", "PORT or PASV must be issued first."},
        {"550", "Requested action not taken."},
        {"550.invalid", "Requested action not taken: {file} is not a valid file name."},
        {"550.STOU.invalid", "Requested action not taken: cannot create a unique file name."},
        {"550.permission", "Permission denied: {file}."},
        {"551", "Requested action aborted: page type unknown."},
    };
}

FtpReply ReplyTranslator::translate(int code, const QString &command,
                                    const QString &subId, const ReplyContext &context) const
{
    QString text = message(code, command, subId);
    text.replace("{file}", context.fileName);
    text.replace("{bytes}", context.bytes >= 0 ? QString::number(context.bytes) : QString());
    return FtpReply(code, text);
}

FtpReply ReplyTranslator::replyFor(const TransferOutcome &outcome, const QString &command,
                                   const ReplyContext &context) const
{
    ReplyContext replyContext = context;
    if (outcome.isSuccess()) {
        replyContext.bytes = outcome.bytes();
    }
    return translate(replyCodeFor(outcome), command, subIdFor(outcome), replyContext);
}

int ReplyTranslator::replyCodeFor(const TransferOutcome &outcome)
{
    switch (outcome.kind()) {
    case TransferOutcome::Kind::Success:
        return FtpReply::ClosingDataConnection;
    case TransferOutcome::Kind::ConnectionAborted:
        return FtpReply::TransferAborted;
    case TransferOutcome::Kind::IoFailure:
        return FtpReply::PageTypeUnknown;
    case TransferOutcome::Kind::SyntaxError:
        return FtpReply::SyntaxErrorInArguments;
    case TransferOutcome::Kind::PreconditionFailed:
        break;
    }

    switch (outcome.precondition()) {
    case TransferOutcome::Precondition::SequenceNotNegotiated:
        return FtpReply::BadSequenceOfCommands;
    case TransferOutcome::Precondition::ConnectionUnavailable:
        return FtpReply::CantOpenDataConnection;
    case TransferOutcome::Precondition::ResourceUnavailable:
    case TransferOutcome::Precondition::PermissionDenied:
    case TransferOutcome::Precondition::None:
        break;
    }
    return FtpReply::ActionNotTaken;
}

QString ReplyTranslator::subIdFor(const TransferOutcome &outcome)
{
    switch (outcome.precondition()) {
    case TransferOutcome::Precondition::SequenceNotNegotiated:
        return QStringLiteral("sequence");
    case TransferOutcome::Precondition::ResourceUnavailable:
        return QStringLiteral("invalid");
    case TransferOutcome::Precondition::PermissionDenied:
        return QStringLiteral("permission");
    case TransferOutcome::Precondition::ConnectionUnavailable:
    case TransferOutcome::Precondition::None:
        break;
    }
    return QString();
}

void ReplyTranslator::setMessage(const QString &key, const QString &text)
{
    messages_.insert(key, text);
}

void ReplyTranslator::setMessages(const QHash<QString, QString> &messages)
{
    for (auto it = messages.constBegin(); it != messages.constEnd(); ++it) {
        messages_.insert(it.key(), it.value());
    }
}

QString ReplyTranslator::message(int code, const QString &command, const QString &subId) const
{
    const QString codeKey = QString::number(code);
    const QString verb = command.toUpper();

    QStringList keys;
    if (!subId.isEmpty()) {
        if (!verb.isEmpty()) {
            keys << codeKey + '.' + verb + '.' + subId;
        }
        keys << codeKey + '.' + subId;
    }
    if (!verb.isEmpty()) {
        keys << codeKey + '.' + verb;
    }
    keys << codeKey;

    for (const QString &key : keys) {
        auto it = messages_.constFind(key);
        if (it != messages_.constEnd()) {
            return it.value();
        }
    }
    return QString();
}
