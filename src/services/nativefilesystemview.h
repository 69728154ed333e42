/**
 * @file nativefilesystemview.h
 * @brief File-system view backed by a directory on the local disk.
 */

#ifndef NATIVEFILESYSTEMVIEW_H
#define NATIVEFILESYSTEMVIEW_H

#include <QFileInfo>
#include <QString>

#include "ifilesystemview.h"

/**
 * @brief Resource handle for a file or directory on the local disk.
 */
class NativeFtpFile : public FtpFile
{
public:
    /**
     * @brief Constructs a handle.
     * @param virtualPath Normalized virtual path ("/dir/file").
     * @param physicalRoot Local directory that "/" maps to.
     * @param userWritable False if the user has no write authority at all.
     */
    NativeFtpFile(const QString &virtualPath, const QString &physicalRoot, bool userWritable);

    [[nodiscard]] QString fullName() const override { return virtualPath_; }
    [[nodiscard]] QString name() const override;
    [[nodiscard]] bool exists() const override { return info_.exists(); }
    [[nodiscard]] bool isDirectory() const override { return info_.isDir(); }
    [[nodiscard]] bool isFile() const override { return info_.isFile(); }
    [[nodiscard]] bool isHidden() const override;
    [[nodiscard]] bool isReadable() const override { return info_.isReadable(); }
    [[nodiscard]] bool hasWritePermission() const override;
    [[nodiscard]] qint64 size() const override { return info_.isFile() ? info_.size() : 0; }
    [[nodiscard]] QDateTime lastModified() const override { return info_.lastModified(); }
    [[nodiscard]] int linkCount() const override { return info_.isDir() ? 3 : 1; }
    [[nodiscard]] QString ownerName() const override;
    [[nodiscard]] QString groupName() const override;
    [[nodiscard]] QList<std::shared_ptr<FtpFile>> listFiles() const override;
    [[nodiscard]] std::unique_ptr<QIODevice> createOutputStream(qint64 offset) override;

    /**
     * @brief Local path of the resource.
     */
    [[nodiscard]] QString physicalPath() const { return info_.filePath(); }

private:
    QString virtualPath_;
    QString physicalRoot_;
    QFileInfo info_;
    bool userWritable_ = true;
};

/**
 * @brief File-system view rooted at a local directory.
 *
 * The user can never leave the root: ".." segments are resolved on the
 * virtual path before it is mapped to the disk.
 *
 * @par Example usage:
 * @code
 * NativeFileSystemView view("/srv/ftp/alice");
 * auto file = view.resolve("pub/readme.txt");
 * if (file && file->exists()) {
 *     qDebug() << file->fullName() << file->size();
 * }
 * @endcode
 */
class NativeFileSystemView : public IFileSystemView
{
public:
    /**
     * @brief Constructs a view.
     * @param rootDirectory Local directory shown as "/".
     * @param writable False for users without write authority.
     */
    explicit NativeFileSystemView(const QString &rootDirectory, bool writable = true);

    [[nodiscard]] QString workingDirectory() const override { return workingDirectory_; }
    [[nodiscard]] std::shared_ptr<FtpFile> resolve(const QString &path) const override;

    /**
     * @brief Returns the local directory shown as "/".
     */
    [[nodiscard]] QString rootDirectory() const { return rootDirectory_; }

    /**
     * @brief Changes the virtual working directory.
     * @param path Absolute or relative virtual path of an existing directory.
     * @return True if the directory exists and was made current.
     */
    bool changeWorkingDirectory(const QString &path);

    /**
     * @brief Resolves a path against a working directory.
     * @param workingDirectory Absolute virtual directory.
     * @param path Absolute or relative path; '\\' is treated as '/'.
     * @return Absolute virtual path without "." or ".." segments, never above "/".
     */
    [[nodiscard]] static QString normalizePath(const QString &workingDirectory, const QString &path);

private:
    QString rootDirectory_;
    QString workingDirectory_ = "/";
    bool writable_ = true;
};

#endif // NATIVEFILESYSTEMVIEW_H
