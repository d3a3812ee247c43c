/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONINGESTOR_H
#define SESSIONINGESTOR_H

#include "sessiontail_export.h"

#include "JsonlDecoder.h"
#include "LogDirectoryWatcher.h"

#include <QList>
#include <QObject>
#include <QString>

#include <functional>

namespace SessionTail
{

class SessionManager;

/**
 * SessionIngestor feeds transcript changes into a SessionManager.
 *
 * For each change: get or create the session, decode from its stored offset,
 * then append the new messages and offset in one step. A failed decode leaves
 * the session untouched so the same bytes are retried on the next change.
 */
class SESSIONTAIL_EXPORT SessionIngestor : public QObject
{
    Q_OBJECT

public:
    using Decoder = std::function<DecodeResult(const QString &path, qint64 offset)>;

    explicit SessionIngestor(SessionManager *manager, QObject *parent = nullptr);

    /**
     * Replace the decoder (JsonlDecoder::decodeFromOffset by default)
     */
    void setDecoder(const Decoder &decoder);

    /**
     * Number of decode failures seen so far
     */
    int failureCount() const
    {
        return m_failureCount;
    }

    /**
     * Ingest events in order, e.g. the result of LogDirectoryWatcher::scanExisting()
     */
    void ingestAll(const QList<LogFileEvent> &events);

public Q_SLOTS:
    /**
     * @return true if the session's messages or offset advanced
     */
    bool ingest(const SessionTail::LogFileEvent &event);

private:
    SessionManager *m_manager = nullptr;
    Decoder m_decoder;
    int m_failureCount = 0;
};

} // namespace SessionTail

#endif // SESSIONINGESTOR_H
