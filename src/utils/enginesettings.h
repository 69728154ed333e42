/**
 * @file enginesettings.h
 * @brief Tunables of the transfer engine, persisted with QSettings.
 */

#ifndef ENGINESETTINGS_H
#define ENGINESETTINGS_H

#include <QHash>
#include <QHostAddress>
#include <QString>

class QSettings;

/**
 * @brief Transfer engine configuration.
 *
 * @par Example usage:
 * @code
 * QSettings ini("ftpxfer.ini", QSettings::IniFormat);
 * EngineSettings settings = EngineSettings::load(ini);
 * TcpDataTransport transport(settings);
 * @endcode
 */
struct EngineSettings {
    /// @name Defaults
    /// @{
    static constexpr int DefaultConnectTimeoutMs = 10000;
    static constexpr int DefaultIdleTimeoutMs = 300000;
    static constexpr int DefaultBufferSize = 4096;
    static constexpr int DefaultUniqueMaxAttempts = 100;
    /// @}

    int connectTimeoutMs = DefaultConnectTimeoutMs;  ///< Connect/accept/TLS handshake timeout
    int idleTimeoutMs = DefaultIdleTimeoutMs;        ///< Max silence during a transfer
    int bufferSize = DefaultBufferSize;              ///< Bytes per read/write chunk

    QHostAddress passiveAddress;  ///< Bind address for PASV, null binds any
    quint16 passivePortMin = 0;   ///< First passive port, 0 lets the system choose
    quint16 passivePortMax = 0;   ///< Last passive port

    QString uniqueDefaultFileName = QStringLiteral("ftp.dat");  ///< STOU base name
    int uniqueMaxAttempts = DefaultUniqueMaxAttempts;          ///< STOU retry bound

    QHash<QString, QString> messages;  ///< Reply text overrides keyed like "550.STOU.permission"

    /**
     * @brief Reads settings, falling back to defaults for missing or invalid values.
     */
    [[nodiscard]] static EngineSettings load(QSettings &settings);

    /**
     * @brief Writes all settings.
     */
    void save(QSettings &settings) const;
};

#endif // ENGINESETTINGS_H
