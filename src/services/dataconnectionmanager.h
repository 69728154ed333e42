/**
 * @file dataconnectionmanager.h
 * @brief Sole entry and exit point for a session's data connection.
 */

#ifndef DATACONNECTIONMANAGER_H
#define DATACONNECTIONMANAGER_H

#include <QString>

#include <memory>
#include <optional>

#include "dataconnectiondescriptor.h"
#include "idatatransport.h"

/**
 * @brief Owns the negotiated descriptor and the open data connection of one session.
 *
 * Enforces single use: a connection can only be opened from a valid
 * descriptor, at most once, and close() always invalidates the descriptor
 * so the next transfer needs a fresh PORT or PASV.
 *
 * @par Example usage:
 * @code
 * DataConnectionGuard release(manager);
 * IDataConnection *connection = manager.open();
 * if (!connection) {
 *     return;  // guard still closes
 * }
 * connection->transferToClient(*listing);
 * @endcode
 */
class DataConnectionManager
{
public:
    /**
     * @brief Constructs a manager.
     * @param transport Transport used to open connections (not owned).
     */
    explicit DataConnectionManager(IDataTransport &transport);

    /**
     * @brief Destructor. Closes any open connection.
     */
    ~DataConnectionManager();

    DataConnectionManager(const DataConnectionManager &) = delete;
    DataConnectionManager &operator=(const DataConnectionManager &) = delete;

    /**
     * @brief Installs the result of a PORT or PASV command.
     *
     * Closes any open connection and drops the previous descriptor.
     */
    void setDescriptor(const DataConnectionDescriptor &descriptor);

    /**
     * @brief Returns the current descriptor, if any.
     */
    [[nodiscard]] const std::optional<DataConnectionDescriptor> &descriptor() const { return descriptor_; }

    /**
     * @brief Checks whether a transfer command may proceed.
     * @return True if a descriptor with a concrete endpoint exists.
     */
    [[nodiscard]] bool isNegotiated() const;

    /**
     * @brief Opens the data connection from the current descriptor.
     * @param errorString Receives a diagnostic on failure, may be null.
     * @return The open connection (owned by the manager), or nullptr if no
     *         descriptor exists, a connection is already open, or the
     *         transport failed.
     */
    IDataConnection *open(QString *errorString = nullptr);

    /**
     * @brief Tears down any open connection and invalidates the descriptor.
     *
     * Idempotent. A connection that does not shut down cleanly is logged.
     */
    void close();

    /**
     * @brief Checks whether a connection is currently open.
     */
    [[nodiscard]] bool isOpen() const { return connection_ != nullptr; }

private:
    IDataTransport &transport_;
    std::optional<DataConnectionDescriptor> descriptor_;
    std::unique_ptr<IDataConnection> connection_;
};

/**
 * @brief Scoped release of a session's data connection.
 *
 * Calls DataConnectionManager::close() when leaving scope, whichever path
 * leaves it.
 */
class DataConnectionGuard
{
public:
    explicit DataConnectionGuard(DataConnectionManager &manager)
        : manager_(manager)
    {
    }

    ~DataConnectionGuard() { manager_.close(); }

    DataConnectionGuard(const DataConnectionGuard &) = delete;
    DataConnectionGuard &operator=(const DataConnectionGuard &) = delete;

private:
    DataConnectionManager &manager_;
};

#endif // DATACONNECTIONMANAGER_H
