/**
 * @file transfercommandengine.h
 * @brief Runs a transfer command through the data connection sequence.
 */

#ifndef TRANSFERCOMMANDENGINE_H
#define TRANSFERCOMMANDENGINE_H

#include "transfercommand.h"
#include "models/ftpsession.h"
#include "services/ftprequest.h"
#include "services/replytranslator.h"
#include "services/transferoutcome.h"

/**
 * @brief Sequences one transfer command invocation.
 *
 * For every invocation the engine:
 * 1. captures the restart offset and resets the session's transient state,
 * 2. refuses with 503 unless PORT or PASV negotiated a data connection,
 * 3. lets the command resolve and check its target (550 or 501 on failure),
 * 4. announces 150,
 * 5. opens the data connection (425 on failure),
 * 6. runs the transfer and replies 226, or 426, 551 or 501 on failure.
 *
 * Exactly one terminal reply is sent per invocation, always chosen by
 * ReplyTranslator::replyFor(). The data connection is released by a
 * DataConnectionGuard on every path, after the terminal reply.
 *
 * The engine keeps no per-invocation state and may serve many sessions
 * concurrently, as long as each session runs one command at a time.
 *
 * @par Example usage:
 * @code
 * ReplyTranslator translator;
 * TransferCommandEngine engine(translator);
 * ListCommand list;
 * engine.execute(list, session, FtpRequest("LIST", "-a /pub"));
 * @endcode
 */
class TransferCommandEngine
{
public:
    /**
     * @brief Constructs an engine.
     * @param translator Reply texts (not owned, must outlive the engine).
     */
    explicit TransferCommandEngine(const ReplyTranslator &translator);

    /**
     * @brief Executes one command invocation.
     * @param command The command steps.
     * @param session The client's session.
     * @param request Verb and argument as received.
     * @return The outcome the terminal reply was chosen from.
     */
    TransferOutcome execute(TransferCommand &command, FtpSession &session, const FtpRequest &request);

private:
    TransferOutcome finish(FtpSession &session, const QString &command,
                           const TransferContext &context, const TransferOutcome &outcome) const;

    const ReplyTranslator &translator_;
};

#endif // TRANSFERCOMMANDENGINE_H
