#ifndef FTPREQUEST_H
#define FTPREQUEST_H

#include <QString>

/**
 * @brief A command received on the control connection, already split by the dispatcher.
 */
struct FtpRequest {
    QString command;   ///< Upper-case verb, e.g. "LIST"
    QString argument;  ///< Raw argument text, empty when none was given

    FtpRequest() = default;
    FtpRequest(const QString &verb, const QString &arg = QString())
        : command(verb.toUpper())
        , argument(arg)
    {
    }

    [[nodiscard]] bool hasArgument() const { return !argument.trimmed().isEmpty(); }
};

#endif // FTPREQUEST_H
