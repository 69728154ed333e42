#include "uniquenamegenerator.h"

#include <QDateTime>
#include <QDebug>

UniqueNameGenerator::UniqueNameGenerator(const QString &defaultFileName, int maxAttempts)
    : defaultFileName_(defaultFileName)
    , maxAttempts_(maxAttempts > 0 ? maxAttempts : 1)
{
}

std::shared_ptr<FtpFile> UniqueNameGenerator::uniqueIn(const IFileSystemView &view,
                                                       const QString &desiredPath)
{
    if (proposed_.size() >= MaxRemembered) {
        forgetStored(view);
    }

    QString basePath = defaultFileName_;
    if (!desiredPath.trimmed().isEmpty()) {
        auto desired = view.resolve(desiredPath);
        if (!desired) {
            return nullptr;
        }
        if (desired->isDirectory()) {
            QString dir = desired->fullName();
            if (!dir.endsWith('/')) {
                dir += '/';
            }
            basePath = dir + defaultFileName_;
        } else {
            basePath = desired->fullName();
        }
    }

    auto candidate = view.resolve(basePath);
    if (!candidate) {
        return nullptr;
    }

    const QString baseName = candidate->fullName();
    for (int attempt = 0;; ++attempt) {
        if (candidate->exists()) {
            // Stored since it was proposed, the hierarchy keeps it unique now
            proposed_.remove(candidate->fullName());
        } else if (!proposed_.contains(candidate->fullName())) {
            proposed_.insert(candidate->fullName());
            return candidate;
        }

        if (attempt >= maxAttempts_) {
            qDebug() << "STOU: No free name for" << baseName << "after" << maxAttempts_ << "attempts";
            return nullptr;
        }

        candidate = view.resolve(baseName + '.' + QString::number(nextSuffix()));
        if (!candidate) {
            return nullptr;
        }
    }
}

qint64 UniqueNameGenerator::nextSuffix()
{
    // Millisecond timestamps, forced strictly increasing
    lastSuffix_ = qMax(QDateTime::currentMSecsSinceEpoch(), lastSuffix_ + 1);
    return lastSuffix_;
}

void UniqueNameGenerator::forgetStored(const IFileSystemView &view)
{
    for (auto it = proposed_.begin(); it != proposed_.end();) {
        auto file = view.resolve(*it);
        if (!file || file->exists()) {
            it = proposed_.erase(it);
        } else {
            ++it;
        }
    }

    // Names proposed but never stored are free again
    if (proposed_.size() >= MaxRemembered) {
        qDebug() << "STOU: Forgetting" << proposed_.size() << "unused proposed names";
        proposed_.clear();
    }
}
