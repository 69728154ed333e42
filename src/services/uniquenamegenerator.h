/**
 * @file uniquenamegenerator.h
 * @brief Proposes collision-free file names for STOU.
 */

#ifndef UNIQUENAMEGENERATOR_H
#define UNIQUENAMEGENERATOR_H

#include <QSet>
#include <QString>

#include <memory>

#include "ifilesystemview.h"

/**
 * @brief Derives a non-existing target name inside a directory.
 *
 * The generator only proposes names; it never creates anything. Names it
 * has proposed before are treated as taken, so repeated calls with the same
 * input yield distinct names even if nothing was stored in between. One
 * instance belongs to one session.
 *
 * @par Example usage:
 * @code
 * UniqueNameGenerator generator("ftp.dat", 100);
 * auto file = generator.uniqueIn(view, "/incoming");
 * // "/incoming/ftp.dat", or "/incoming/ftp.dat.1718000000123" if taken
 * @endcode
 */
class UniqueNameGenerator
{
public:
    /// Proposed names remembered before stored ones are forgotten
    static constexpr int MaxRemembered = 256;

    /**
     * @brief Constructs a generator.
     * @param defaultFileName Base name used for an empty path or a directory.
     * @param maxAttempts Number of suffixed candidates tried before giving up.
     */
    explicit UniqueNameGenerator(const QString &defaultFileName = QStringLiteral("ftp.dat"),
                                 int maxAttempts = 100);

    /**
     * @brief Finds a name that does not exist yet.
     * @param view File-system view to check against.
     * @param desiredPath Requested path; a directory or empty means the default name.
     * @return A handle to a non-existing resource, or nullptr if resolution
     *         failed or no free name was found within the attempt bound.
     */
    [[nodiscard]] std::shared_ptr<FtpFile> uniqueIn(const IFileSystemView &view, const QString &desiredPath);

    [[nodiscard]] QString defaultFileName() const { return defaultFileName_; }
    [[nodiscard]] int maxAttempts() const { return maxAttempts_; }

    /**
     * @brief Number of proposed names that are not known to exist yet.
     */
    [[nodiscard]] int rememberedCount() const { return proposed_.size(); }

private:
    [[nodiscard]] qint64 nextSuffix();
    void forgetStored(const IFileSystemView &view);

    QString defaultFileName_;
    int maxAttempts_;
    qint64 lastSuffix_ = 0;
    QSet<QString> proposed_;
};

#endif // UNIQUENAMEGENERATOR_H
