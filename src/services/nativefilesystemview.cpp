#include "nativefilesystemview.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QStringList>

NativeFtpFile::NativeFtpFile(const QString &virtualPath, const QString &physicalRoot,
                             bool userWritable)
    : virtualPath_(virtualPath)
    , physicalRoot_(physicalRoot)
    , info_(virtualPath == "/" ? physicalRoot : physicalRoot + virtualPath)
    , userWritable_(userWritable)
{
}

QString NativeFtpFile::name() const
{
    if (virtualPath_ == "/") {
        return virtualPath_;
    }
    return virtualPath_.mid(virtualPath_.lastIndexOf('/') + 1);
}

bool NativeFtpFile::isHidden() const
{
    // The root is never hidden, even if the local directory is
    return virtualPath_ != "/" && name().startsWith('.');
}

bool NativeFtpFile::hasWritePermission() const
{
    if (!userWritable_) {
        return false;
    }

    if (info_.exists()) {
        return info_.isWritable();
    }

    // Not created yet: the nearest existing ancestor inside the root decides
    QString virtualParent = virtualPath_;
    while (virtualParent != "/") {
        const int slash = virtualParent.lastIndexOf('/');
        virtualParent = slash <= 0 ? QStringLiteral("/") : virtualParent.left(slash);

        const QFileInfo parentInfo(virtualParent == "/" ? physicalRoot_
                                                       : physicalRoot_ + virtualParent);
        if (parentInfo.exists()) {
            return parentInfo.isDir() && parentInfo.isWritable();
        }
    }
    return QFileInfo(physicalRoot_).isWritable();
}

QString NativeFtpFile::ownerName() const
{
    const QString owner = info_.owner();
    return owner.isEmpty() ? QStringLiteral("user") : owner;
}

QString NativeFtpFile::groupName() const
{
    const QString group = info_.group();
    return group.isEmpty() ? QStringLiteral("group") : group;
}

QList<std::shared_ptr<FtpFile>> NativeFtpFile::listFiles() const
{
    QList<std::shared_ptr<FtpFile>> files;
    if (!info_.isDir()) {
        return files;
    }

    const QDir dir(info_.filePath());
    const QFileInfoList entries = dir.entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::Name);

    const QString prefix = virtualPath_ == "/" ? QString() : virtualPath_;
    files.reserve(entries.size());
    for (const QFileInfo &entry : entries) {
        files.append(std::make_shared<NativeFtpFile>(prefix + '/' + entry.fileName(),
                                                     physicalRoot_, userWritable_));
    }
    return files;
}

std::unique_ptr<QIODevice> NativeFtpFile::createOutputStream(qint64 offset)
{
    if (!hasWritePermission()) {
        qDebug() << "FS: No write permission for" << virtualPath_;
        return nullptr;
    }

    // Unbuffered so a failing write(2) surfaces in the transfer, not in close()
    auto file = std::make_unique<QFile>(info_.filePath());
    const QIODevice::OpenMode mode = (offset > 0 ? QIODevice::ReadWrite
                                                 : QIODevice::WriteOnly | QIODevice::Truncate)
                                     | QIODevice::Unbuffered;
    if (!file->open(mode)) {
        qWarning() << "FS: Cannot open" << info_.filePath() << "for writing:" << file->errorString();
        return nullptr;
    }

    if (offset > 0) {
        // Content after the restart offset is discarded, a shorter file is zero-extended
        if (!file->resize(offset) || !file->seek(offset)) {
            qWarning() << "FS: Cannot position" << info_.filePath() << "at" << offset
                       << ":" << file->errorString();
            return nullptr;
        }
    }

    info_.refresh();
    return file;
}

NativeFileSystemView::NativeFileSystemView(const QString &rootDirectory, bool writable)
    : rootDirectory_(QDir::cleanPath(QDir(rootDirectory).absolutePath()))
    , writable_(writable)
{
}

std::shared_ptr<FtpFile> NativeFileSystemView::resolve(const QString &path) const
{
    if (path.contains(QChar('\0'))) {
        return nullptr;
    }
    return std::make_shared<NativeFtpFile>(normalizePath(workingDirectory_, path),
                                           rootDirectory_, writable_);
}

bool NativeFileSystemView::changeWorkingDirectory(const QString &path)
{
    auto dir = resolve(path);
    if (!dir || !dir->isDirectory()) {
        return false;
    }
    workingDirectory_ = dir->fullName();
    return true;
}

QString NativeFileSystemView::normalizePath(const QString &workingDirectory, const QString &path)
{
    QString combined = path.trimmed();
    combined.replace('\\', '/');
    if (!combined.startsWith('/')) {
        combined = workingDirectory + '/' + combined;
    }

    QStringList segments;
    const QStringList parts = combined.split('/', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!segments.isEmpty()) {
                segments.removeLast();
            }
            continue;
        }
        segments.append(part);
    }

    return '/' + segments.join('/');
}
