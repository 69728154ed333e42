/**
 * @file directorylister.h
 * @brief Assembles the byte stream sent for LIST and NLST.
 */

#ifndef DIRECTORYLISTER_H
#define DIRECTORYLISTER_H

#include <QByteArray>
#include <QIODevice>
#include <QList>

#include <memory>

#include "filelistformatter.h"
#include "ifilesystemview.h"
#include "models/listargument.h"

/**
 * @brief Read-only sequential device that formats entries as they are read.
 *
 * Nothing is rendered up front; each readData() call formats just enough
 * entries to satisfy the request. The formatter must outlive the device.
 */
class ListingDevice : public QIODevice
{
    Q_OBJECT

public:
    ListingDevice(QList<std::shared_ptr<FtpFile>> entries,
                  const IFileFormatter &formatter,
                  QObject *parent = nullptr);

    [[nodiscard]] bool isSequential() const override { return true; }
    [[nodiscard]] qint64 bytesAvailable() const override;
    [[nodiscard]] bool atEnd() const override;

    /**
     * @brief Number of entries that will be rendered in total.
     */
    [[nodiscard]] int entryCount() const { return static_cast<int>(entries_.size()); }

protected:
    qint64 readData(char *data, qint64 maxSize) override;
    qint64 writeData(const char *data, qint64 maxSize) override;

private:
    void renderNext();

    QList<std::shared_ptr<FtpFile>> entries_;
    const IFileFormatter &formatter_;
    int nextEntry_ = 0;
    QByteArray pending_;
};

/**
 * @brief Resolves a listing argument against a view and produces its stream.
 *
 * Stateless; safe to call from any number of sessions at once.
 *
 * @par Example usage:
 * @code
 * ListFileFormatter formatter;
 * auto argument = ListArgumentParser::parse("-a");
 * auto stream = DirectoryLister::listFiles(*argument, view, formatter);
 * connection.transferToClient(*stream);
 * @endcode
 */
class DirectoryLister
{
public:
    /**
     * @brief Builds the listing stream.
     *
     * A directory yields its immediate children sorted by name, hidden ones
     * only with the 'a' option, filtered by the argument's pattern. A file
     * yields its own line. A path that does not resolve or does not exist
     * yields an empty stream.
     *
     * @return A fresh device, already open for reading.
     */
    [[nodiscard]] static std::unique_ptr<QIODevice> listFiles(const ListArgument &argument,
                                                              const IFileSystemView &view,
                                                              const IFileFormatter &formatter);

    /**
     * @brief Selects the entries a listing would render, without formatting them.
     */
    [[nodiscard]] static QList<std::shared_ptr<FtpFile>> selectEntries(const ListArgument &argument,
                                                                       const IFileSystemView &view);
};

#endif // DIRECTORYLISTER_H
