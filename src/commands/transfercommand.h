/**
 * @file transfercommand.h
 * @brief Base class for commands that move bytes over a data connection.
 */

#ifndef TRANSFERCOMMAND_H
#define TRANSFERCOMMAND_H

#include <QString>

#include <memory>
#include <optional>

#include "models/ftpsession.h"
#include "services/idatatransport.h"
#include "services/ifilesystemview.h"
#include "services/transferoutcome.h"

/**
 * @brief Per-invocation data shared between the steps of one command.
 */
struct TransferContext
{
    QString argument;                ///< Raw argument, may be empty
    std::shared_ptr<FtpFile> target; ///< Resolved resource, set by prepare()
    qint64 restartOffset = 0;        ///< REST offset captured before the state reset

    /**
     * @brief Name reported in replies: the target's path if resolved, else the argument.
     */
    [[nodiscard]] QString fileName() const { return target ? target->fullName() : argument; }
};

/**
 * @brief The command-specific steps run by TransferCommandEngine.
 *
 * Subclasses hold no per-invocation state; everything an invocation needs
 * lives in the TransferContext, so one instance serves every session.
 */
class TransferCommand
{
public:
    virtual ~TransferCommand() = default;

    /**
     * @brief The command verb, e.g. "LIST".
     */
    [[nodiscard]] virtual QString name() const = 0;

    /**
     * @brief Resolves and checks the target before anything is announced.
     * @return std::nullopt to proceed, or the outcome that ends the command
     *         without opening a data connection.
     */
    virtual std::optional<TransferOutcome> prepare(FtpSession &session, TransferContext &context)
    {
        Q_UNUSED(session)
        Q_UNUSED(context)
        return std::nullopt;
    }

    /**
     * @brief Moves the bytes over an open data connection.
     */
    virtual TransferOutcome transfer(FtpSession &session, IDataConnection &connection,
                                     TransferContext &context) = 0;

    /**
     * @brief Called after a successful transfer, before the 226 reply.
     */
    virtual void transferSucceeded(FtpSession &session, const TransferContext &context,
                                   const TransferOutcome &outcome)
    {
        Q_UNUSED(session)
        Q_UNUSED(context)
        Q_UNUSED(outcome)
    }
};

#endif // TRANSFERCOMMAND_H
