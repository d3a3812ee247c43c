/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "JsonlDecoder.h"

#include <QFile>
#include <QIODevice>
#include <QJsonDocument>
#include <QJsonObject>

namespace SessionTail
{

bool JsonlDecoder::decodeLine(const QByteArray &line, Message *message)
{
    const QByteArray trimmed = line.trimmed();
    if (trimmed.isEmpty() || trimmed.size() > MaxLineLength) {
        return false;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return false;
    }

    if (message) {
        *message = Message::fromJson(doc.object());
    }
    return true;
}

// Longest chunk handed out by readLine(): a full line of MaxLineLength plus its newline
static const qint64 ReadLimit = JsonlDecoder::MaxLineLength + 2;

// Discard the remainder of an overlong line. Returns false if the device ran
// out before a newline; @p skipped counts the bytes read either way.
static bool skipRestOfLine(QIODevice &device, qint64 *skipped)
{
    while (!device.atEnd()) {
        const QByteArray part = device.readLine(ReadLimit);
        if (part.isEmpty()) {
            return false;
        }
        *skipped += part.size();
        if (part.endsWith('\n')) {
            return true;
        }
    }
    return false;
}

QList<Message> JsonlDecoder::decode(QIODevice &device)
{
    QList<Message> messages;

    while (!device.atEnd()) {
        const QByteArray line = device.readLine(ReadLimit);
        if (line.isEmpty()) {
            break;
        }

        if (!line.endsWith('\n') && !device.atEnd()) {
            qint64 skipped = 0;
            skipRestOfLine(device, &skipped);
            continue;
        }

        Message msg;
        if (decodeLine(line, &msg)) {
            messages.append(msg);
        }
    }

    return messages;
}

DecodeResult JsonlDecoder::decodeFromOffset(const QString &path, qint64 offset)
{
    DecodeResult result;
    result.newOffset = offset;

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        result.errorString = QStringLiteral("failed to open file %1: %2").arg(path, file.errorString());
        return result;
    }

    // Truncated or replaced file: nothing new past our offset
    if (offset >= file.size()) {
        result.ok = true;
        return result;
    }

    if (offset > 0 && !file.seek(offset)) {
        result.errorString = QStringLiteral("failed to seek to offset %1: %2").arg(offset).arg(file.errorString());
        return result;
    }

    qint64 consumed = 0;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine(ReadLimit);
        if (line.isEmpty()) {
            break;
        }

        if (!line.endsWith('\n')) {
            if (file.atEnd()) {
                // Unterminated tail: keep it only if the writer already finished the object
                Message msg;
                if (decodeLine(line, &msg)) {
                    result.messages.append(msg);
                    consumed += line.size();
                }
                break;
            }

            // Overlong line: skipped once its newline has been written
            qint64 skipped = line.size();
            if (!skipRestOfLine(file, &skipped)) {
                break;
            }
            consumed += skipped;
            continue;
        }

        Message msg;
        if (decodeLine(line, &msg)) {
            result.messages.append(msg);
        }
        consumed += line.size();
    }

    result.newOffset = offset + consumed;
    result.ok = true;
    return result;
}

} // namespace SessionTail
