/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef JSONLDECODER_H
#define JSONLDECODER_H

#include "sessiontail_export.h"

#include "Message.h"

#include <QByteArray>
#include <QList>
#include <QString>

class QIODevice;

namespace SessionTail
{

/**
 * Outcome of an incremental decode.
 *
 * On failure @c newOffset equals the offset that was asked for, so the caller
 * can retry the same bytes on the next change notification.
 */
struct SESSIONTAIL_EXPORT DecodeResult {
    QList<Message> messages;
    qint64 newOffset = 0;
    bool ok = false;
    QString errorString;
};

/**
 * JsonlDecoder turns an append-only JSONL transcript into Messages.
 *
 * Blank lines, malformed lines and lines that are not JSON objects are skipped.
 */
class SESSIONTAIL_EXPORT JsonlDecoder
{
public:
    /**
     * Lines longer than this are skipped
     */
    static constexpr qint64 MaxLineLength = 1024 * 1024;

    /**
     * Decode every line readable from @p device
     */
    static QList<Message> decode(QIODevice &device);

    /**
     * Decode the lines appended to @p path since @p offset.
     *
     * Only complete lines are consumed. A trailing line without a newline is
     * consumed only if it already holds a complete JSON object; otherwise the
     * returned offset stops in front of it.
     */
    static DecodeResult decodeFromOffset(const QString &path, qint64 offset);

    /**
     * Decode a single line. Returns false if the line holds no usable message.
     */
    static bool decodeLine(const QByteArray &line, Message *message);
};

} // namespace SessionTail

#endif // JSONLDECODER_H
