/**
 * @file ftpreply.h
 * @brief FTP reply value and RFC 959 reply codes used by the transfer engine.
 */

#ifndef FTPREPLY_H
#define FTPREPLY_H

#include <QByteArray>
#include <QString>

/**
 * @brief A single reply sent on the control connection.
 *
 * A reply is a three digit code plus human-readable text. Text containing
 * line breaks is rendered in the RFC 959 multi-line form.
 */
struct FtpReply {
    /// @name FTP Response Codes (RFC 959)
    /// @{
    static constexpr int FileStatusOk = 150;  ///< File status okay, about to open data connection
    static constexpr int ClosingDataConnection = 226;  ///< Closing data connection, transfer complete
    static constexpr int CantOpenDataConnection = 425;  ///< Can't open data connection
    static constexpr int TransferAborted = 426;  ///< Connection closed, transfer aborted
    static constexpr int SyntaxErrorInArguments = 501;  ///< Syntax error in parameters or arguments
    static constexpr int BadSequenceOfCommands = 503;  ///< Bad sequence of commands
    static constexpr int ActionNotTaken = 550;  ///< Requested action not taken
    static constexpr int PageTypeUnknown = 551;  ///< Requested action aborted: page type unknown
    /// @}

    int code = 0;  ///< Three digit reply code
    QString text;  ///< Reply text, may span several lines

    FtpReply() = default;
    FtpReply(int replyCode, const QString &replyText)
        : code(replyCode)
        , text(replyText)
    {
    }

    /**
     * @brief Checks for a positive preliminary (1xx) reply.
     */
    [[nodiscard]] bool isPreliminary() const { return code >= 100 && code < 200; }

    /**
     * @brief Checks for a negative (4xx or 5xx) reply.
     */
    [[nodiscard]] bool isNegative() const { return code >= 400; }

    /**
     * @brief Renders the reply as sent on the control connection.
     * @return UTF-8 bytes terminated by CRLF.
     *
     * Single line: "226 Closing data connection.\r\n".
     * Multi-line: "150-first\r\n second\r\n150 last\r\n".
     */
    [[nodiscard]] QByteArray toWireFormat() const;

    bool operator==(const FtpReply &other) const
    {
        return code == other.code && text == other.text;
    }
    bool operator!=(const FtpReply &other) const { return !(*this == other); }
};

#endif // FTPREPLY_H
