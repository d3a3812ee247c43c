/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Message.h"

#include <QJsonArray>
#include <QStringList>

namespace SessionTail
{

// tool_result content is either a string or an array of {type: text, text} blocks
static QString flattenToolResult(const QJsonValue &content)
{
    if (content.isString()) {
        return content.toString();
    }

    QStringList parts;
    const QJsonArray array = content.toArray();
    for (const QJsonValue &value : array) {
        const QJsonObject obj = value.toObject();
        if (obj.value(QStringLiteral("type")).toString() == QLatin1String("text")) {
            parts.append(obj.value(QStringLiteral("text")).toString());
        }
    }
    return parts.join(QLatin1Char('\n'));
}

static QList<ContentBlock> blocksFromContent(const QJsonValue &content)
{
    QList<ContentBlock> blocks;

    if (content.isString()) {
        const QString text = content.toString();
        if (!text.isEmpty()) {
            ContentBlock block;
            block.type = QStringLiteral("text");
            block.text = text;
            blocks.append(block);
        }
        return blocks;
    }

    const QJsonArray array = content.toArray();
    for (const QJsonValue &value : array) {
        if (value.isObject()) {
            blocks.append(ContentBlock::fromJson(value.toObject()));
        }
    }
    return blocks;
}

ContentBlock ContentBlock::fromJson(const QJsonObject &obj)
{
    ContentBlock block;
    block.type = obj.value(QStringLiteral("type")).toString();
    block.text = obj.value(QStringLiteral("text")).toString();
    block.thinking = obj.value(QStringLiteral("thinking")).toString();
    block.name = obj.value(QStringLiteral("name")).toString();

    const QJsonValue input = obj.value(QStringLiteral("input"));
    block.input = input.isUndefined() ? QJsonValue() : input;

    if (block.type == QLatin1String("tool_result") && block.text.isEmpty()) {
        block.text = flattenToolResult(obj.value(QStringLiteral("content")));
    }
    return block;
}

QString Message::plainText() const
{
    QStringList parts;
    for (const ContentBlock &block : blocks) {
        if (block.type == QLatin1String("text") || block.type == QLatin1String("tool_result")) {
            if (!block.text.isEmpty()) {
                parts.append(block.text);
            }
        } else if (block.type == QLatin1String("tool_use")) {
            parts.append(QStringLiteral("[tool: %1]").arg(block.name));
        }
    }
    return parts.join(QLatin1Char('\n'));
}

Message Message::fromJson(const QJsonObject &obj)
{
    Message msg;
    msg.type = obj.value(QStringLiteral("type")).toString();
    msg.agentId = obj.value(QStringLiteral("agentId")).toString();
    msg.sessionId = obj.value(QStringLiteral("sessionId")).toString();
    msg.timestamp = obj.value(QStringLiteral("timestamp")).toString();

    const QJsonValue inner = obj.value(QStringLiteral("message"));
    if (inner.isObject()) {
        msg.blocks = blocksFromContent(inner.toObject().value(QStringLiteral("content")));
    } else if (inner.isString()) {
        msg.blocks = blocksFromContent(inner);
    }

    // Some record types carry their content at the top level
    if (msg.blocks.isEmpty()) {
        msg.blocks = blocksFromContent(obj.value(QStringLiteral("content")));
    }

    return msg;
}

} // namespace SessionTail
