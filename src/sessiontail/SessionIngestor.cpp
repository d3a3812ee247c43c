/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionIngestor.h"
#include "SessionManager.h"

#include <QDebug>

namespace SessionTail
{

SessionIngestor::SessionIngestor(SessionManager *manager, QObject *parent)
    : QObject(parent)
    , m_manager(manager)
    , m_decoder(&JsonlDecoder::decodeFromOffset)
{
}

void SessionIngestor::setDecoder(const Decoder &decoder)
{
    m_decoder = decoder ? decoder : Decoder(&JsonlDecoder::decodeFromOffset);
}

void SessionIngestor::ingestAll(const QList<LogFileEvent> &events)
{
    for (const LogFileEvent &event : events) {
        ingest(event);
    }
}

bool SessionIngestor::ingest(const LogFileEvent &event)
{
    if (!m_manager || !event.isValid()) {
        return false;
    }

    const Session session = m_manager->getOrCreate(event.sessionId, event.path, event.parentId, event.isSubagent);
    if (!session.isValid()) {
        return false;
    }

    const DecodeResult result = m_decoder(session.path, session.offset);
    if (!result.ok) {
        ++m_failureCount;
        qWarning() << "SessionIngestor::ingest() - keeping offset" << session.offset << "for" << session.id << "-" << result.errorString;
        return false;
    }

    if (result.messages.isEmpty() && result.newOffset == session.offset) {
        return false;
    }

    m_manager->append(session.id, result.messages, result.newOffset);
    return true;
}

} // namespace SessionTail

#include "moc_SessionIngestor.cpp"
