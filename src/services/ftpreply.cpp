#include "ftpreply.h"

#include <QRegularExpression>
#include <QStringList>

QByteArray FtpReply::toWireFormat() const
{
    const QString codeText = QString::number(code);
    QStringList lines = text.split(QRegularExpression("\r?\n"));

    if (lines.size() <= 1) {
        return (codeText + ' ' + text + "\r\n").toUtf8();
    }

    QString wire = codeText + '-' + lines.takeFirst() + "\r\n";
    const QString last = lines.takeLast();
    for (const QString &line : lines) {
        // Continuation lines must not look like a final reply line
        wire += ' ' + line + "\r\n";
    }
    wire += codeText + ' ' + last + "\r\n";
    return wire.toUtf8();
}
