/**
 * @file transferoutcome.h
 * @brief Result of one step of a transfer command.
 *
 * Every failure the transfer engine can meet is expressed as a value of this
 * type instead of being thrown, so the reply for each terminal state can be
 * chosen in a single place (ReplyTranslator::replyFor).
 */

#ifndef TRANSFEROUTCOME_H
#define TRANSFEROUTCOME_H

#include <QString>

/**
 * @brief Closed set of outcomes of a transfer command step.
 *
 * @par Example usage:
 * @code
 * TransferOutcome outcome = connection->transferToClient(*listing);
 * if (outcome.isSuccess()) {
 *     qDebug() << "sent" << outcome.bytes() << "bytes";
 * }
 * @endcode
 */
class TransferOutcome
{
public:
    /**
     * @brief Kind of outcome.
     */
    enum class Kind {
        Success,            ///< Transfer completed, byte count is valid
        ConnectionAborted,  ///< Data connection closed or reset mid-transfer
        IoFailure,          ///< Any other I/O error (local file, stream)
        SyntaxError,        ///< Command argument could not be parsed
        PreconditionFailed  ///< Transfer not attempted, see Precondition
    };

    /**
     * @brief Why a transfer was not attempted.
     */
    enum class Precondition {
        None,                   ///< Not a precondition failure
        SequenceNotNegotiated,  ///< No PORT or PASV before the transfer command
        ConnectionUnavailable,  ///< Data connection could not be opened
        ResourceUnavailable,    ///< Target could not be resolved or made unique
        PermissionDenied        ///< Target resolved but is not writable
    };

    /// @name Factories
    /// @{
    [[nodiscard]] static TransferOutcome success(qint64 bytes);
    [[nodiscard]] static TransferOutcome connectionAborted(const QString &reason = QString());
    [[nodiscard]] static TransferOutcome ioFailure(const QString &reason = QString());
    [[nodiscard]] static TransferOutcome syntaxError(const QString &reason = QString());
    [[nodiscard]] static TransferOutcome preconditionFailed(Precondition precondition,
                                                            const QString &reason = QString());
    /// @}

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] Precondition precondition() const { return precondition_; }
    [[nodiscard]] bool isSuccess() const { return kind_ == Kind::Success; }

    /**
     * @brief Bytes moved over the data connection.
     * @return Byte count for Success, otherwise the bytes moved before failing.
     */
    [[nodiscard]] qint64 bytes() const { return bytes_; }

    /**
     * @brief Diagnostic text for logs (socket or file error string).
     */
    [[nodiscard]] QString reason() const { return reason_; }

    /**
     * @brief Records how many bytes were moved before a failure.
     */
    TransferOutcome &withBytes(qint64 bytes)
    {
        bytes_ = bytes;
        return *this;
    }

    bool operator==(const TransferOutcome &other) const
    {
        return kind_ == other.kind_ && precondition_ == other.precondition_
               && bytes_ == other.bytes_;
    }
    bool operator!=(const TransferOutcome &other) const { return !(*this == other); }

    /**
     * @brief Short name of the outcome kind for logging.
     */
    [[nodiscard]] QString toString() const;

private:
    TransferOutcome(Kind kind, Precondition precondition, qint64 bytes, const QString &reason)
        : kind_(kind)
        , precondition_(precondition)
        , bytes_(bytes)
        , reason_(reason)
    {
    }

    Kind kind_ = Kind::Success;
    Precondition precondition_ = Precondition::None;
    qint64 bytes_ = 0;
    QString reason_;
};

#endif // TRANSFEROUTCOME_H
