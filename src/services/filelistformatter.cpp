#include "filelistformatter.h"

namespace {

const char *const MonthNames[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

} // namespace

QByteArray ListFileFormatter::format(const FtpFile &file) const
{
    const qint64 size = file.isDirectory() ? 0 : file.size();

    QString line;
    line.reserve(80);
    line += permissions(file);
    line += QStringLiteral("   ");
    line += QString::number(file.linkCount());
    line += ' ';
    line += file.ownerName();
    line += ' ';
    line += file.groupName();
    line += ' ';
    line += QString::number(size).rightJustified(SizeWidth, ' ');
    line += ' ';
    line += formatUnixDate(file.lastModified(), QDateTime::currentDateTimeUtc());
    line += ' ';
    line += file.name();
    line += QStringLiteral("\r\n");

    return line.toUtf8();
}

QString ListFileFormatter::formatUnixDate(const QDateTime &modified, const QDateTime &now)
{
    const QDateTime utc = modified.isValid() ? modified.toUTC()
                                             : QDateTime::fromMSecsSinceEpoch(0, Qt::UTC);
    const QDate date = utc.date();

    // Month names are fixed English abbreviations regardless of locale
    QString result = QString::fromLatin1(MonthNames[date.month() - 1]);
    result += ' ';
    result += QString::number(date.day()).rightJustified(2, '0');
    result += ' ';

    const qint64 age = now.toMSecsSinceEpoch() - utc.toMSecsSinceEpoch();
    if (age >= 0 && age <= SixMonthsMs) {
        result += utc.time().toString(QStringLiteral("HH:mm"));
    } else {
        result += ' ';
        result += QString::number(date.year());
    }
    return result;
}

QString ListFileFormatter::permissions(const FtpFile &file)
{
    QString perm(10, '-');
    if (file.isDirectory()) {
        perm[0] = 'd';
    }
    if (file.isReadable()) {
        perm[1] = 'r';
    }
    if (file.hasWritePermission()) {
        perm[2] = 'w';
    }
    if (file.isDirectory()) {
        perm[3] = 'x';
    }
    return perm;
}

QByteArray NlstFileFormatter::format(const FtpFile &file) const
{
    return (file.name() + QStringLiteral("\r\n")).toUtf8();
}
