/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MESSAGE_H
#define MESSAGE_H

#include "sessiontail_export.h"

#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>

namespace SessionTail
{

/**
 * One content block of a transcript message.
 *
 * Block types written by the agent:
 * - "text": assistant or user prose in @c text
 * - "thinking": extended thinking in @c thinking
 * - "tool_use": a tool call, tool name in @c name, arguments in @c input
 * - "tool_result": output of a tool call, flattened into @c text
 */
struct SESSIONTAIL_EXPORT ContentBlock {
    QString type;
    QString text;
    QString thinking;
    QString name; // tool name
    QJsonValue input; // tool input (null, bool, number, string, array or object)

    static ContentBlock fromJson(const QJsonObject &obj);

    bool operator==(const ContentBlock &other) const
    {
        return type == other.type && text == other.text && thinking == other.thinking && name == other.name && input == other.input;
    }
};

/**
 * Message is one decoded line of a session's JSONL transcript.
 */
class SESSIONTAIL_EXPORT Message
{
public:
    Message() = default;

    QString type; // "user", "assistant", "system", ...
    QList<ContentBlock> blocks;
    QString agentId; // set on sub-agent transcripts
    QString sessionId;
    QString timestamp; // as written by the agent (ISO 8601)

    /**
     * A message without a type is not worth keeping
     */
    bool isValid() const
    {
        return !type.isEmpty();
    }

    /**
     * Text blocks joined with newlines; tool calls render as "[tool: name]"
     */
    QString plainText() const;

    /**
     * Build a message from one parsed transcript line.
     *
     * The content may live under "message.content" or at the top level, and may be
     * either a plain string or an array of blocks.
     */
    static Message fromJson(const QJsonObject &obj);

    bool operator==(const Message &other) const
    {
        return type == other.type && blocks == other.blocks && agentId == other.agentId && sessionId == other.sessionId
            && timestamp == other.timestamp;
    }
};

} // namespace SessionTail

#endif // MESSAGE_H
