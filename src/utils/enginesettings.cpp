#include "enginesettings.h"

#include <QDebug>
#include <QSettings>
#include <QStringList>

namespace {

int readPositive(QSettings &settings, const QString &key, int fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }

    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok || value <= 0) {
        qWarning() << "Settings: Invalid value for" << key << "- using" << fallback;
        return fallback;
    }
    return value;
}

quint16 readPort(QSettings &settings, const QString &key)
{
    bool ok = false;
    const int value = settings.value(key, 0).toInt(&ok);
    if (!ok || value < 0 || value > 65535) {
        qWarning() << "Settings: Invalid port for" << key << "- using any port";
        return 0;
    }
    return static_cast<quint16>(value);
}

} // namespace

EngineSettings EngineSettings::load(QSettings &settings)
{
    EngineSettings result;

    result.connectTimeoutMs = readPositive(settings, "transfer/connectTimeoutMs",
                                           DefaultConnectTimeoutMs);
    result.idleTimeoutMs = readPositive(settings, "transfer/idleTimeoutMs", DefaultIdleTimeoutMs);
    result.bufferSize = readPositive(settings, "transfer/bufferSize", DefaultBufferSize);

    const QString address = settings.value("passive/address").toString().trimmed();
    if (!address.isEmpty()) {
        if (!result.passiveAddress.setAddress(address)) {
            qWarning() << "Settings: Invalid passive/address" << address << "- binding any";
            result.passiveAddress.clear();
        }
    }

    result.passivePortMin = readPort(settings, "passive/portMin");
    result.passivePortMax = readPort(settings, "passive/portMax");
    if (result.passivePortMin != 0 && result.passivePortMax < result.passivePortMin) {
        result.passivePortMax = result.passivePortMin;
    }

    const QString defaultName = settings.value("stou/defaultFileName").toString().trimmed();
    if (!defaultName.isEmpty()) {
        if (defaultName.contains('/')) {
            qWarning() << "Settings: stou/defaultFileName must not contain '/' - using"
                       << result.uniqueDefaultFileName;
        } else {
            result.uniqueDefaultFileName = defaultName;
        }
    }
    result.uniqueMaxAttempts = readPositive(settings, "stou/maxAttempts", DefaultUniqueMaxAttempts);

    settings.beginGroup("messages");
    const QStringList keys = settings.childKeys();
    for (const QString &key : keys) {
        // Unquoted INI values containing commas come back as lists
        const QVariant value = settings.value(key);
        result.messages.insert(key, value.typeId() == QMetaType::QStringList
                                        ? value.toStringList().join(", ")
                                        : value.toString());
    }
    settings.endGroup();

    return result;
}

void EngineSettings::save(QSettings &settings) const
{
    settings.setValue("transfer/connectTimeoutMs", connectTimeoutMs);
    settings.setValue("transfer/idleTimeoutMs", idleTimeoutMs);
    settings.setValue("transfer/bufferSize", bufferSize);
    settings.setValue("passive/address", passiveAddress.isNull() ? QString() : passiveAddress.toString());
    settings.setValue("passive/portMin", static_cast<int>(passivePortMin));
    settings.setValue("passive/portMax", static_cast<int>(passivePortMax));
    settings.setValue("stou/defaultFileName", uniqueDefaultFileName);
    settings.setValue("stou/maxAttempts", uniqueMaxAttempts);

    settings.beginGroup("messages");
    for (auto it = messages.constBegin(); it != messages.constEnd(); ++it) {
        settings.setValue(it.key(), it.value());
    }
    settings.endGroup();
}
