/**
 * @file replytranslator.h
 * @brief Maps transfer outcomes to FTP replies and reply codes to message text.
 */

#ifndef REPLYTRANSLATOR_H
#define REPLYTRANSLATOR_H

#include <QHash>
#include <QString>

#include "ftpreply.h"
#include "transferoutcome.h"

/**
 * @brief Values substituted into reply text.
 *
 * Message templates may contain "{file}" and "{bytes}" placeholders.
 */
struct ReplyContext {
    QString fileName;   ///< Resource the command acted on, empty if none
    qint64 bytes = -1;  ///< Bytes transferred, negative if unknown
};

/**
 * @brief Selects the reply for every terminal state of a transfer command.
 *
 * Message texts are looked up by key, most specific first:
 * "<code>.<COMMAND>.<subId>", "<code>.<subId>", "<code>.<COMMAND>", "<code>".
 * Built-in English defaults cover every code the engine emits; any key can be
 * overridden with setMessage(), typically from the "messages" settings group.
 *
 * The translator holds no per-session state and is safe to share between
 * sessions once configured.
 *
 * @par Example usage:
 * @code
 * ReplyTranslator translator;
 * FtpReply reply = translator.replyFor(TransferOutcome::success(42), "STOU",
 *                                      ReplyContext{"/ftp.dat", 42});
 * // reply.code == 226
 * @endcode
 */
class ReplyTranslator
{
public:
    ReplyTranslator();

    /**
     * @brief Builds a reply for an explicit code.
     * @param code Reply code.
     * @param command Command verb, used for message lookup.
     * @param subId Optional message variant, e.g. "permission".
     * @param context Placeholder values.
     */
    [[nodiscard]] FtpReply translate(int code, const QString &command,
                                     const QString &subId = QString(),
                                     const ReplyContext &context = ReplyContext()) const;

    /**
     * @brief The single decision point from outcome to reply.
     * @param outcome Result of the failed or completed step.
     * @param command Command verb.
     * @param context Placeholder values; bytes are taken from a successful outcome.
     * @return 226 for success, 426/551/501 for transfer failures, 503/425/550 for
     *         precondition failures.
     */
    [[nodiscard]] FtpReply replyFor(const TransferOutcome &outcome, const QString &command,
                                    const ReplyContext &context = ReplyContext()) const;

    /**
     * @brief Returns the reply code replyFor() would use for an outcome.
     */
    [[nodiscard]] static int replyCodeFor(const TransferOutcome &outcome);

    /**
     * @brief Overrides or adds a message template.
     * @param key Lookup key such as "550.STOU.permission".
     * @param text Template text.
     */
    void setMessage(const QString &key, const QString &text);

    /**
     * @brief Applies several overrides at once.
     */
    void setMessages(const QHash<QString, QString> &messages);

    /**
     * @brief Returns the resolved template for a code/command/subId triple.
     */
    [[nodiscard]] QString message(int code, const QString &command,
                                  const QString &subId = QString()) const;

private:
    [[nodiscard]] static QString subIdFor(const TransferOutcome &outcome);

    QHash<QString, QString> messages_;
};

#endif // REPLYTRANSLATOR_H
