#include "directorylister.h"

#include <QRegularExpression>

#include <algorithm>

ListingDevice::ListingDevice(QList<std::shared_ptr<FtpFile>> entries,
                             const IFileFormatter &formatter,
                             QObject *parent)
    : QIODevice(parent)
    , entries_(std::move(entries))
    , formatter_(formatter)
{
}

qint64 ListingDevice::bytesAvailable() const
{
    return pending_.size() + QIODevice::bytesAvailable();
}

bool ListingDevice::atEnd() const
{
    return pending_.isEmpty() && nextEntry_ >= entries_.size() && QIODevice::atEnd();
}

qint64 ListingDevice::readData(char *data, qint64 maxSize)
{
    while (pending_.size() < maxSize && nextEntry_ < entries_.size()) {
        renderNext();
    }

    if (pending_.isEmpty()) {
        return 0;
    }

    const qint64 count = std::min<qint64>(maxSize, pending_.size());
    std::copy_n(pending_.constData(), count, data);
    pending_.remove(0, static_cast<int>(count));
    return count;
}

qint64 ListingDevice::writeData(const char *data, qint64 maxSize)
{
    Q_UNUSED(data)
    Q_UNUSED(maxSize)
    return -1;
}

void ListingDevice::renderNext()
{
    const auto &entry = entries_.at(nextEntry_++);
    if (entry) {
        pending_.append(formatter_.format(*entry));
    }
}

std::unique_ptr<QIODevice> DirectoryLister::listFiles(const ListArgument &argument,
                                                      const IFileSystemView &view,
                                                      const IFileFormatter &formatter)
{
    auto device = std::make_unique<ListingDevice>(selectEntries(argument, view), formatter);
    device->open(QIODevice::ReadOnly);
    return device;
}

QList<std::shared_ptr<FtpFile>> DirectoryLister::selectEntries(const ListArgument &argument,
                                                               const IFileSystemView &view)
{
    QList<std::shared_ptr<FtpFile>> selected;

    auto target = view.resolve(argument.path);
    if (!target || !target->exists()) {
        return selected;
    }

    if (!target->isDirectory()) {
        selected.append(target);
        return selected;
    }

    const bool showHidden = argument.hasOption('a');
    QRegularExpression pattern;
    if (argument.hasPattern()) {
        pattern.setPattern(QRegularExpression::wildcardToRegularExpression(argument.pattern));
    }

    const auto children = target->listFiles();
    for (const auto &child : children) {
        if (!child) {
            continue;
        }
        if (!showHidden && child->isHidden()) {
            continue;
        }
        if (argument.hasPattern() && !pattern.match(child->name()).hasMatch()) {
            continue;
        }
        selected.append(child);
    }
    return selected;
}
