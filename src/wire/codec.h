#pragma once
#include "types.h"
#include "gateway/failure.h"
#include <QByteArray>
#include <expected>

namespace wire_codec {

// Inbound request body -> ChatRequest. Fails with InvalidInput.
Result<ChatRequest> decodeChatRequest(const QByteArray& body);
Result<ChatRequest> decodeChatRequest(const QJsonObject& root);
QJsonObject encodeChatRequest(const ChatRequest& request);

QJsonObject encodeMessage(const Message& message);

// Strict decode used for backends that already speak the chat-completion
// schema. The error string names the first missing or mistyped field.
std::expected<ChatResponse, QString> decodeChatResponse(const QJsonObject& root);
QJsonObject encodeChatResponse(const ChatResponse& response);

Result<QByteArray> encodeChatChunk(const ChatChunk& chunk);

QJsonObject encodeModelList(const QList<ModelDescriptor>& models);

QByteArray toCompactJson(const QJsonObject& obj);

}
