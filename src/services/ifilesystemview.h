/**
 * @file ifilesystemview.h
 * @brief Interfaces for the user-scoped view of the file hierarchy.
 *
 * These interfaces allow the transfer commands to work against any storage
 * backend. Production code uses NativeFileSystemView; tests inject
 * MockFileSystemView.
 */

#ifndef IFILESYSTEMVIEW_H
#define IFILESYSTEMVIEW_H

#include <QDateTime>
#include <QIODevice>
#include <QList>
#include <QString>

#include <memory>

/**
 * @brief Abstract reference to a file or directory inside a file-system view.
 *
 * A handle may refer to a resource that does not exist yet, e.g. the
 * target of an upload.
 */
class FtpFile
{
public:
    virtual ~FtpFile() = default;

    /**
     * @brief Absolute virtual path, always starting with '/'.
     */
    [[nodiscard]] virtual QString fullName() const = 0;

    /**
     * @brief Last path segment ("/" for the root).
     */
    [[nodiscard]] virtual QString name() const = 0;

    [[nodiscard]] virtual bool exists() const = 0;
    [[nodiscard]] virtual bool isDirectory() const = 0;
    [[nodiscard]] virtual bool isFile() const = 0;
    [[nodiscard]] virtual bool isHidden() const = 0;
    [[nodiscard]] virtual bool isReadable() const = 0;

    /**
     * @brief Checks whether the current user may create or overwrite this resource.
     *
     * For a non-existing resource this reflects the nearest existing parent.
     */
    [[nodiscard]] virtual bool hasWritePermission() const = 0;

    [[nodiscard]] virtual qint64 size() const = 0;
    [[nodiscard]] virtual QDateTime lastModified() const = 0;
    [[nodiscard]] virtual int linkCount() const = 0;
    [[nodiscard]] virtual QString ownerName() const = 0;
    [[nodiscard]] virtual QString groupName() const = 0;

    /**
     * @brief Lists immediate children of a directory.
     * @return Entries sorted by name; empty for files or on error.
     */
    [[nodiscard]] virtual QList<std::shared_ptr<FtpFile>> listFiles() const = 0;

    /**
     * @brief Opens the resource for writing.
     * @param offset Restart offset; existing content beyond it is discarded.
     * @return An open device, or nullptr if the resource cannot be written.
     */
    [[nodiscard]] virtual std::unique_ptr<QIODevice> createOutputStream(qint64 offset) = 0;
};

/**
 * @brief The file hierarchy as seen by one authenticated user.
 *
 * Paths are virtual: "/" is the user's root and relative paths are resolved
 * against the working directory. Implementations must tolerate concurrent
 * reads from several sessions.
 */
class IFileSystemView
{
public:
    virtual ~IFileSystemView() = default;

    /**
     * @brief Returns the virtual working directory.
     */
    [[nodiscard]] virtual QString workingDirectory() const = 0;

    /**
     * @brief Resolves a path to a resource handle.
     * @param path Absolute or relative virtual path.
     * @return A handle (which may not exist), or nullptr if the path cannot be
     *         represented in this view.
     */
    [[nodiscard]] virtual std::shared_ptr<FtpFile> resolve(const QString &path) const = 0;
};

#endif // IFILESYSTEMVIEW_H
