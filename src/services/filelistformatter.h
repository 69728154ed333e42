/**
 * @file filelistformatter.h
 * @brief Line formatters for directory listings.
 */

#ifndef FILELISTFORMATTER_H
#define FILELISTFORMATTER_H

#include <QByteArray>
#include <QDateTime>
#include <QString>

#include "ifilesystemview.h"

/**
 * @brief Renders one listing line for an entry.
 *
 * Implementations hold no mutable state and may be shared by any number of
 * sessions.
 */
class IFileFormatter
{
public:
    virtual ~IFileFormatter() = default;

    /**
     * @brief Formats an entry, including the trailing CRLF.
     */
    [[nodiscard]] virtual QByteArray format(const FtpFile &file) const = 0;
};

/**
 * @brief Unix "ls -l" style lines, as sent for LIST.
 *
 * @code
 * drwxr-xr-x   3 user group            0 Mar 04 11:20 docs
 * -rw-------   1 user group         1234 Dec 24  2019 notes.txt
 * @endcode
 */
class ListFileFormatter : public IFileFormatter
{
public:
    [[nodiscard]] QByteArray format(const FtpFile &file) const override;

    /**
     * @brief Formats a modification time the way ls does.
     *
     * Times within six months of @p now show the clock time, older (or
     * future) ones the year. Always rendered in UTC.
     */
    [[nodiscard]] static QString formatUnixDate(const QDateTime &modified, const QDateTime &now);

    /**
     * @brief Builds the ten-character permission string.
     */
    [[nodiscard]] static QString permissions(const FtpFile &file);

private:
    static constexpr qint64 SixMonthsMs = 183LL * 24 * 60 * 60 * 1000;
    static constexpr int SizeWidth = 12;
};

/**
 * @brief Bare names, one per line, as sent for NLST.
 */
class NlstFileFormatter : public IFileFormatter
{
public:
    [[nodiscard]] QByteArray format(const FtpFile &file) const override;
};

#endif // FILELISTFORMATTER_H
