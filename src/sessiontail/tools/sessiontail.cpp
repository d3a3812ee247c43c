/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    sessiontail - follow the Claude transcripts of a project

    Watches ~/.claude/projects/{project}/ for session and sub-agent transcripts
    and prints every new message as it is written.

    Usage:
        sessiontail [--project <dir>] [--panels <n>] [--exclude <pattern>]... [--list]
*/

#include "../LogDirectoryWatcher.h"
#include "../SessionIngestor.h"
#include "../SessionManager.h"
#include "../TailSettings.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

using namespace SessionTail;

static QString describe(const Session &session)
{
    return QStringLiteral("%1 (%2 messages, updated %3)")
        .arg(session.id)
        .arg(session.messages.size())
        .arg(session.lastUpdate.toLocalTime().toString(QStringLiteral("HH:mm:ss")));
}

static void printForest(QTextStream &out, const SessionManager &manager, const SessionForest &forest, int depth)
{
    for (const SessionNode &node : forest) {
        const Session session = manager.session(node.sessionId);
        out << QString(depth * 2, QLatin1Char(' ')) << (depth > 0 ? "└ " : "") << describe(session) << "\n";
        printForest(out, manager, node.children, depth + 1);
    }
}

static void printPanels(QTextStream &out, const SessionManager &manager)
{
    const QList<Session> occupants = manager.slotOccupants();
    for (int i = 0; i < occupants.size(); ++i) {
        out << "panel " << (i + 1) << ": " << (occupants.at(i).isValid() ? describe(occupants.at(i)) : QStringLiteral("(empty)")) << "\n";
    }
}

// First line of the message text, so one message stays on one output line
static QString firstLine(const QString &text)
{
    const qsizetype newline = text.indexOf(QLatin1Char('\n'));
    return newline < 0 ? text : text.left(newline) + QStringLiteral(" …");
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("sessiontail"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    TailSettings settings;

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Real-time viewer for Claude session transcripts"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption projectOption(QStringList() << QStringLiteral("d") << QStringLiteral("project"),
                                     QStringLiteral("Project directory whose sessions to follow (default: current directory)"),
                                     QStringLiteral("dir"),
                                     QStringLiteral("."));
    parser.addOption(projectOption);

    QCommandLineOption panelsOption(QStringList() << QStringLiteral("p") << QStringLiteral("panels"),
                                    QStringLiteral("Number of panels, 1-5 (default: %1)").arg(settings.panelCount()),
                                    QStringLiteral("n"),
                                    QString::number(settings.panelCount()));
    parser.addOption(panelsOption);

    QCommandLineOption excludeOption(QStringList() << QStringLiteral("x") << QStringLiteral("exclude"),
                                     QStringLiteral("Hide sessions whose id contains this pattern (repeatable)"),
                                     QStringLiteral("pattern"));
    parser.addOption(excludeOption);

    QCommandLineOption listOption(QStringList() << QStringLiteral("l") << QStringLiteral("list"),
                                  QStringLiteral("Print the session tree and panel assignment, then exit"));
    parser.addOption(listOption);

    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    bool panelsOk = false;
    const int panels = parser.value(panelsOption).toInt(&panelsOk);
    if (!panelsOk) {
        err << "Error: --panels expects a number, got " << parser.value(panelsOption) << "\n";
        return 1;
    }

    const QString projectPath = QFileInfo(parser.value(projectOption)).absoluteFilePath();
    const QString transcriptDir = QDir(settings.projectsRoot()).filePath(LogDirectoryWatcher::claudeProjectDirName(projectPath));
    if (!QFileInfo(transcriptDir).isDir()) {
        err << "Error: Claude project directory does not exist: " << transcriptDir << "\n"
            << "Make sure Claude Code has been used in " << projectPath << "\n";
        return 1;
    }

    const QStringList excludePatterns = settings.excludePatterns() + parser.values(excludeOption);

    SessionManager manager(panels, excludePatterns);
    LogDirectoryWatcher watcher(transcriptDir);
    SessionIngestor ingestor(&manager);

    ingestor.ingestAll(watcher.scanExisting());

    if (parser.isSet(listOption)) {
        printForest(out, manager, manager.buildSorted(), 0);
        out << "\n";
        printPanels(out, manager);
        return 0;
    }

    printPanels(out, manager);
    out << "\nFollowing " << transcriptDir << "\n";
    out.flush();

    QObject::connect(&watcher, &LogDirectoryWatcher::logFileChanged, &ingestor, &SessionIngestor::ingest);
    QObject::connect(&manager, &SessionManager::sessionAppended, &app, [&](const QString &id, int messageCount) {
        if (manager.isExcluded(id)) {
            return;
        }

        const Session session = manager.session(id);
        const qsizetype first = qMax<qsizetype>(0, session.messages.size() - messageCount);
        for (qsizetype i = first; i < session.messages.size(); ++i) {
            const Message &msg = session.messages.at(i);
            const QString text = msg.plainText();
            if (text.isEmpty()) {
                continue;
            }
            out << "[" << id << "] " << msg.type << ": " << firstLine(text) << "\n";
        }
        out.flush();
    });

    if (!watcher.start()) {
        err << "Error: failed to watch " << transcriptDir << "\n";
        return 1;
    }

    return app.exec();
}
