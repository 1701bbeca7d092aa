/**
 * @file main.cpp
 * @brief ChunkFetch command-line entry point
 *
 * Parses options, loads the optional INI file and runs one DownloadTask.
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QStandardPaths>
#include <QTextStream>

#include <csignal>

#include "chunkfetch/engine/DownloadOptions.h"
#include "chunkfetch/engine/DownloadTask.h"

namespace {

ChunkFetch::DownloadTask* g_activeTask = nullptr;

extern "C" void handleTerminationSignal(int /*signal*/)
{
    if (g_activeTask) {
        g_activeTask->cancel();
    }
}

QString configFilePath(const QCommandLineParser& parser, const QCommandLineOption& configOption)
{
    if (parser.isSet(configOption)) {
        return parser.value(configOption);
    }
    return QStandardPaths::locate(QStandardPaths::AppConfigLocation,
                                  QStringLiteral("chunkfetch.ini"));
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Application metadata
    app.setOrganizationName(QStringLiteral("ChunkFetch"));
    app.setApplicationName(QStringLiteral("chunkfetch"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    qSetMessagePattern(QStringLiteral(
        "%{if-warning}warning: %{endif}%{if-critical}error: %{endif}%{message}"));

    QTextStream out(stdout);
    QTextStream err(stderr);

    // ───────────────────────────────────────────────────────────────────────
    // Command line
    // ───────────────────────────────────────────────────────────────────────

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Chunked concurrent HTTP downloader"));
    parser.addHelpOption();

    QCommandLineOption urlOption({QStringLiteral("u"), QStringLiteral("url")},
        QStringLiteral("URL to download (required)."), QStringLiteral("url"));
    QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
        QStringLiteral("Output file path (default: filename from URL)."), QStringLiteral("path"));
    QCommandLineOption threadsOption({QStringLiteral("t"), QStringLiteral("threads")},
        QStringLiteral("Number of download threads (default: number of CPU cores)."),
        QStringLiteral("count"));
    QCommandLineOption retriesOption({QStringLiteral("r"), QStringLiteral("retries")},
        QStringLiteral("Maximum number of retries for failed chunks."), QStringLiteral("count"));
    QCommandLineOption quietOption({QStringLiteral("q"), QStringLiteral("quiet")},
        QStringLiteral("Suppress output except for errors."));
    QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("INI file with default settings."), QStringLiteral("file"));
    QCommandLineOption versionOption({QStringLiteral("v"), QStringLiteral("version")},
        QStringLiteral("Show version information."));

    parser.addOptions({urlOption, outputOption, threadsOption, retriesOption,
                       quietOption, configOption, versionOption});
    parser.addPositionalArgument(QStringLiteral("url"), QStringLiteral("URL to download."),
                                 QStringLiteral("[url]"));

    parser.process(app);

    if (parser.isSet(versionOption)) {
        out << "ChunkFetch v" << app.applicationVersion() << Qt::endl;
        out << "Qt version: " << qVersion() << Qt::endl;
        return 0;
    }

    QString url = parser.value(urlOption);
    if (url.isEmpty() && !parser.positionalArguments().isEmpty()) {
        url = parser.positionalArguments().constFirst();
    }
    if (url.isEmpty()) {
        err << "Error: URL is required." << Qt::endl << Qt::endl;
        err << parser.helpText();
        return 1;
    }

    // ───────────────────────────────────────────────────────────────────────
    // Options: defaults, then the INI file, then the command line
    // ───────────────────────────────────────────────────────────────────────

    ChunkFetch::DownloadOptions options = ChunkFetch::DownloadOptions::defaults();

    const QString configPath = configFilePath(parser, configOption);
    if (!configPath.isEmpty()) {
        if (!QFileInfo::exists(configPath)) {
            err << "Error: config file not found: " << configPath << Qt::endl;
            return 1;
        }
        QSettings settings(configPath, QSettings::IniFormat);
        if (settings.status() != QSettings::NoError) {
            err << "Error: cannot read config file: " << configPath << Qt::endl;
            return 1;
        }
        options.loadSettings(settings);
    }

    options.url = QUrl::fromUserInput(url);
    options.outputPath = parser.value(outputOption);

    if (parser.isSet(threadsOption)) {
        bool ok = false;
        options.threadCount = parser.value(threadsOption).toInt(&ok);
        if (!ok) {
            err << "Error: invalid thread count: " << parser.value(threadsOption) << Qt::endl;
            return 1;
        }
    }

    if (parser.isSet(retriesOption)) {
        bool ok = false;
        options.maxRetries = parser.value(retriesOption).toInt(&ok);
        if (!ok) {
            err << "Error: invalid retry count: " << parser.value(retriesOption) << Qt::endl;
            return 1;
        }
    }

    if (parser.isSet(quietOption)) {
        options.verbose = false;
    }

    // QT_LOGGING_RULES in the environment still overrides these
    QLoggingCategory::setFilterRules(options.verbose
        ? QStringLiteral("*.debug=false")
        : QStringLiteral("*.debug=false\n*.info=false"));

    // ───────────────────────────────────────────────────────────────────────
    // Run
    // ───────────────────────────────────────────────────────────────────────

    ChunkFetch::DownloadTask task(options);

    g_activeTask = &task;
    std::signal(SIGINT, handleTerminationSignal);
    std::signal(SIGTERM, handleTerminationSignal);

    ChunkFetch::DownloadError error = task.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_activeTask = nullptr;

    if (error.category == ChunkFetch::ErrorCategory::Cancelled) {
        err << Qt::endl << "Download canceled" << Qt::endl;
        return 1;
    }

    if (error.hasError()) {
        err << "Error: " << error.toString() << Qt::endl;
        return 1;
    }

    return 0;
}
