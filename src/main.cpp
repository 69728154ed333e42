#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QSettings>

#include "models/listargument.h"
#include "services/directorylister.h"
#include "services/filelistformatter.h"
#include "services/nativefilesystemview.h"
#include "utils/enginesettings.h"
#include "utils/logging.h"
#include "version.h"

namespace {

constexpr int ExitFailure = 1;
constexpr int ExitSyntaxError = 2;

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("ftpxfer-ls");
    app.setApplicationVersion(FTPXFER_VERSION);
    app.setOrganizationName("ftpxfer");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Prints a directory listing exactly as the FTP LIST or NLST "
                                     "command sends it over the data connection");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption nlstOption(
        "nlst",
        "Use the NLST format (bare names) instead of LIST");
    parser.addOption(nlstOption);

    QCommandLineOption configOption(
        "config",
        "Read engine settings from an INI <file>",
        "file");
    parser.addOption(configOption);

    QCommandLineOption rootOption(
        "root",
        "Serve <directory> as the virtual root (default: current directory)",
        "directory",
        ".");
    parser.addOption(rootOption);

    parser.addPositionalArgument("argument", "Listing argument, e.g. -a /pub/*.txt", "[argument...]");

    parser.process(app);

    // Set verbose logging flag
    ftpxfer::verboseLogging = parser.isSet(verboseOption);

    if (ftpxfer::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    EngineSettings settings;
    if (parser.isSet(configOption)) {
        const QString configPath = parser.value(configOption);
        if (!QFile::exists(configPath)) {
            qCritical() << "Config file not found:" << configPath;
            return ExitFailure;
        }
        QSettings ini(configPath, QSettings::IniFormat);
        if (ini.status() != QSettings::NoError) {
            qCritical() << "Cannot read config file:" << configPath;
            return ExitFailure;
        }
        settings = EngineSettings::load(ini);
    }

    NativeFileSystemView view(parser.value(rootOption), false);
    if (!view.resolve("/")->isDirectory()) {
        qCritical() << "Root is not a directory:" << view.rootDirectory();
        return ExitFailure;
    }
    LOG_VERBOSE() << "Root:" << view.rootDirectory();

    QString error;
    const QString rawArgument = parser.positionalArguments().join(' ');
    const std::optional<ListArgument> argument = ListArgumentParser::parse(rawArgument, &error);
    if (!argument) {
        qCritical().noquote() << "501" << error;
        return ExitSyntaxError;
    }

    const ListFileFormatter listFormatter;
    const NlstFileFormatter nlstFormatter;
    const bool bareNames = parser.isSet(nlstOption) && !argument->hasOption('l');
    const IFileFormatter &formatter = bareNames ? static_cast<const IFileFormatter &>(nlstFormatter)
                                                : listFormatter;

    std::unique_ptr<QIODevice> listing = DirectoryLister::listFiles(*argument, view, formatter);

    QFile out;
    if (!out.open(stdout, QIODevice::WriteOnly)) {
        qCritical() << "Cannot write to standard output:" << out.errorString();
        return ExitFailure;
    }

    QByteArray buffer(settings.bufferSize, Qt::Uninitialized);
    qint64 total = 0;
    forever {
        const qint64 read = listing->read(buffer.data(), buffer.size());
        if (read <= 0) {
            break;
        }
        if (out.write(buffer.constData(), read) != read) {
            qCritical() << "Write to standard output failed:" << out.errorString();
            return ExitFailure;
        }
        total += read;
    }
    out.flush();

    LOG_VERBOSE() << "Listed" << total << "bytes";
    return 0;
}
