/**
 * @file ftpsession.h
 * @brief Per-client state seen by the transfer commands.
 */

#ifndef FTPSESSION_H
#define FTPSESSION_H

#include <QString>

#include <memory>
#include <optional>

#include "services/dataconnectionmanager.h"
#include "services/ftpreply.h"
#include "services/idatatransport.h"
#include "services/ifilesystemview.h"
#include "services/ireplychannel.h"
#include "services/uniquenamegenerator.h"
#include "utils/enginesettings.h"

/**
 * @brief State of one authenticated client.
 *
 * Created when the client has logged in, mutated by every command and
 * destroyed on logout or disconnect. A session runs one command at a time;
 * it is not shared between threads.
 *
 * @par Example usage:
 * @code
 * ControlReplyWriter replies(controlSocket);
 * FtpSession session("alice",
 *                    std::make_unique<NativeFileSystemView>("/srv/ftp/alice"),
 *                    transport, replies, settings);
 * session.setDataDescriptor(*transport.createPassiveDescriptor());
 * engine.execute(listCommand, session, FtpRequest("LIST", "-a"));
 * @endcode
 */
class FtpSession
{
public:
    /**
     * @brief File structure negotiated with STRU. Only File is supported.
     */
    enum class Structure {
        File
    };

    /**
     * @brief Constructs a session.
     * @param identity Name of the authenticated user.
     * @param view The user's file-system view (owned).
     * @param transport Data connection factory (not owned).
     * @param replies Control connection reply channel (not owned).
     * @param settings Engine settings.
     */
    FtpSession(const QString &identity,
               std::unique_ptr<IFileSystemView> view,
               IDataTransport &transport,
               IReplyChannel &replies,
               const EngineSettings &settings = EngineSettings());

    FtpSession(const FtpSession &) = delete;
    FtpSession &operator=(const FtpSession &) = delete;

    [[nodiscard]] QString identity() const { return identity_; }
    [[nodiscard]] IFileSystemView &fileSystemView() const { return *view_; }

    /**
     * @brief Sends a reply on the control connection.
     */
    void write(const FtpReply &reply) { replies_.send(reply); }

    /// @name Data Connection
    /// @{

    [[nodiscard]] DataConnectionManager &dataConnection() { return dataConnection_; }

    /**
     * @brief Returns the negotiated descriptor, if any.
     */
    [[nodiscard]] const std::optional<DataConnectionDescriptor> &currentDataDescriptor() const
    {
        return dataConnection_.descriptor();
    }

    /**
     * @brief Installs the result of PORT or PASV, invalidating the previous one.
     */
    void setDataDescriptor(const DataConnectionDescriptor &descriptor)
    {
        dataConnection_.setDescriptor(descriptor);
    }

    /**
     * @brief Drops the descriptor and closes any open data connection.
     */
    void invalidateDataDescriptor() { dataConnection_.close(); }
    /// @}

    /// @name Transfer Parameters
    /// @{
    [[nodiscard]] TransferType transferType() const { return transferType_; }
    void setTransferType(TransferType type) { transferType_ = type; }
    [[nodiscard]] Structure structure() const { return structure_; }
    void setStructure(Structure structure) { structure_ = structure; }
    /// @}

    /// @name Transient State
    /// @{

    /**
     * @brief Offset set by REST for the next transfer.
     */
    [[nodiscard]] qint64 restartOffset() const { return restartOffset_; }
    void setRestartOffset(qint64 offset) { restartOffset_ = offset > 0 ? offset : 0; }

    /**
     * @brief Path set by RNFR for the next RNTO.
     */
    [[nodiscard]] std::optional<QString> renameFrom() const { return renameFrom_; }
    void setRenameFrom(const QString &path) { renameFrom_ = path; }

    /**
     * @brief Clears REST and RNFR state, keeping the negotiated data connection.
     */
    void resetTransientState();
    /// @}

    /**
     * @brief Session-scoped generator for STOU names.
     */
    [[nodiscard]] UniqueNameGenerator &uniqueNames() { return uniqueNames_; }

private:
    QString identity_;
    std::unique_ptr<IFileSystemView> view_;
    IReplyChannel &replies_;
    DataConnectionManager dataConnection_;
    UniqueNameGenerator uniqueNames_;

    TransferType transferType_ = TransferType::Ascii;
    Structure structure_ = Structure::File;
    qint64 restartOffset_ = 0;
    std::optional<QString> renameFrom_;
};

#endif // FTPSESSION_H
