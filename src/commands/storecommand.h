/**
 * @file storecommand.h
 * @brief STOR and STOU: uploads over the data connection.
 */

#ifndef STORECOMMAND_H
#define STORECOMMAND_H

#include "transfercommand.h"
#include "services/iftpstatistics.h"

/**
 * @brief STOR: stores the received bytes under the given name.
 *
 * The target is resolved and its write permission checked before 150 is
 * sent. The upload starts at the REST offset, if one was set. A completed
 * upload is logged and reported to the statistics sink.
 */
class StoreCommand : public TransferCommand
{
public:
    /**
     * @brief Constructs the command.
     * @param statistics Upload sink (not owned), may be null.
     */
    explicit StoreCommand(IFtpStatistics *statistics = nullptr);

    [[nodiscard]] QString name() const override { return QStringLiteral("STOR"); }

    std::optional<TransferOutcome> prepare(FtpSession &session, TransferContext &context) override;
    TransferOutcome transfer(FtpSession &session, IDataConnection &connection,
                             TransferContext &context) override;
    void transferSucceeded(FtpSession &session, const TransferContext &context,
                           const TransferOutcome &outcome) override;

protected:
    /**
     * @brief Rejects a resolved target the session may not write.
     */
    [[nodiscard]] static std::optional<TransferOutcome> checkWritable(const FtpFile &target);

private:
    IFtpStatistics *statistics_;
};

/**
 * @brief STOU: stores under a name that does not exist yet.
 *
 * The argument, if any, names a directory or a base file name. The chosen
 * name is announced in the 150 reply as "FILE: <name>".
 */
class StoreUniqueCommand : public StoreCommand
{
public:
    using StoreCommand::StoreCommand;

    [[nodiscard]] QString name() const override { return QStringLiteral("STOU"); }

    std::optional<TransferOutcome> prepare(FtpSession &session, TransferContext &context) override;
};

#endif // STORECOMMAND_H
