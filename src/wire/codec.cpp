#include "codec.h"
#include <QJsonDocument>
#include <QSet>
#include <cmath>
#include <limits>

namespace {

const QSet<QString>& knownRequestFields()
{
    static const QSet<QString> fields = {
        QStringLiteral("model"),
        QStringLiteral("messages"),
        QStringLiteral("temperature"),
        QStringLiteral("top_p"),
        QStringLiteral("n"),
        QStringLiteral("stream"),
        QStringLiteral("stop"),
        QStringLiteral("max_tokens"),
        QStringLiteral("presence_penalty"),
        QStringLiteral("frequency_penalty"),
        QStringLiteral("user"),
        QStringLiteral("tools"),
        QStringLiteral("tool_choice"),
    };
    return fields;
}

// Absent and explicit null both mean "not set".
bool isUnset(const QJsonValue& value)
{
    return value.isUndefined() || value.isNull();
}

bool isInteger(const QJsonValue& value)
{
    if (!value.isDouble())
        return false;
    const double d = value.toDouble();
    return std::isfinite(d) && std::floor(d) == d;
}

GatewayError badField(const QString& field, const QString& expected)
{
    return GatewayError::invalidInput(
        QStringLiteral("Field '%1' must be %2").arg(field, expected));
}

Result<std::optional<double>> optionalDouble(const QJsonObject& root, const QString& key)
{
    const QJsonValue v = root.value(key);
    if (isUnset(v))
        return std::optional<double>{};
    if (!v.isDouble())
        return std::unexpected(badField(key, QStringLiteral("a number")));
    return std::optional<double>{v.toDouble()};
}

Result<std::optional<int>> optionalInt(const QJsonObject& root, const QString& key)
{
    const QJsonValue v = root.value(key);
    if (isUnset(v))
        return std::optional<int>{};
    if (!isInteger(v) || v.toDouble() < 0
        || v.toDouble() > std::numeric_limits<int>::max())
        return std::unexpected(badField(key, QStringLiteral("a non-negative integer")));
    return std::optional<int>{v.toInt()};
}

Result<std::optional<QString>> optionalString(const QJsonObject& root, const QString& key)
{
    const QJsonValue v = root.value(key);
    if (isUnset(v))
        return std::optional<QString>{};
    if (!v.isString())
        return std::unexpected(badField(key, QStringLiteral("a string")));
    return std::optional<QString>{v.toString()};
}

Result<Message> decodeMessage(const QJsonValue& value, const QString& where)
{
    if (!value.isObject())
        return std::unexpected(badField(where, QStringLiteral("an object")));

    const QJsonObject obj = value.toObject();
    Message msg;

    const QJsonValue role = obj.value(QStringLiteral("role"));
    if (!role.isString())
        return std::unexpected(badField(where + QStringLiteral(".role"), QStringLiteral("a string")));
    msg.role = role.toString();

    const QJsonValue content = obj.value(QStringLiteral("content"));
    if (!isUnset(content)) {
        if (!content.isString())
            return std::unexpected(badField(where + QStringLiteral(".content"),
                                            QStringLiteral("a string")));
        msg.content = content.toString();
    }

    const QJsonValue name = obj.value(QStringLiteral("name"));
    if (!isUnset(name)) {
        if (!name.isString())
            return std::unexpected(badField(where + QStringLiteral(".name"), QStringLiteral("a string")));
        msg.name = name.toString();
    }

    const QJsonValue toolCalls = obj.value(QStringLiteral("tool_calls"));
    if (!isUnset(toolCalls)) {
        if (!toolCalls.isArray())
            return std::unexpected(badField(where + QStringLiteral(".tool_calls"),
                                            QStringLiteral("an array")));
        msg.toolCalls = toolCalls.toArray();
    }

    return msg;
}

std::expected<quint32, QString> requireCount(const QJsonObject& obj, const QString& key)
{
    const QJsonValue v = obj.value(key);
    if (!isInteger(v) || v.toDouble() < 0
        || v.toDouble() > std::numeric_limits<quint32>::max())
        return std::unexpected(QStringLiteral("usage.%1 must be a non-negative integer").arg(key));
    return static_cast<quint32>(v.toInteger());
}

}

namespace wire_codec {

Result<ChatRequest> decodeChatRequest(const QByteArray& body)
{
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        return std::unexpected(GatewayError::invalidInput(
            QStringLiteral("Request body is not valid JSON: %1").arg(parseErr.errorString())));
    }
    if (!doc.isObject()) {
        return std::unexpected(GatewayError::invalidInput(
            QStringLiteral("Request body must be a JSON object")));
    }
    return decodeChatRequest(doc.object());
}

Result<ChatRequest> decodeChatRequest(const QJsonObject& root)
{
    ChatRequest req;

    const QJsonValue model = root.value(QStringLiteral("model"));
    if (!model.isString())
        return std::unexpected(badField(QStringLiteral("model"), QStringLiteral("a string")));
    req.model = model.toString();

    const QJsonValue messages = root.value(QStringLiteral("messages"));
    if (!messages.isArray())
        return std::unexpected(badField(QStringLiteral("messages"), QStringLiteral("an array")));
    const QJsonArray msgArray = messages.toArray();
    for (int i = 0; i < msgArray.size(); ++i) {
        auto msg = decodeMessage(msgArray.at(i), QStringLiteral("messages[%1]").arg(i));
        if (!msg)
            return std::unexpected(msg.error());
        req.messages.append(*msg);
    }

    auto temperature = optionalDouble(root, QStringLiteral("temperature"));
    if (!temperature) return std::unexpected(temperature.error());
    req.temperature = *temperature;

    auto topP = optionalDouble(root, QStringLiteral("top_p"));
    if (!topP) return std::unexpected(topP.error());
    req.topP = *topP;

    auto n = optionalInt(root, QStringLiteral("n"));
    if (!n) return std::unexpected(n.error());
    req.n = *n;

    const QJsonValue stream = root.value(QStringLiteral("stream"));
    if (!isUnset(stream)) {
        if (!stream.isBool())
            return std::unexpected(badField(QStringLiteral("stream"), QStringLiteral("a boolean")));
        req.stream = stream.toBool();
    }

    const QJsonValue stop = root.value(QStringLiteral("stop"));
    if (!isUnset(stop)) {
        if (stop.isString()) {
            req.stop = QStringList{stop.toString()};
            req.stopAsString = true;
        } else if (stop.isArray()) {
            QStringList sequences;
            for (const QJsonValue& sv : stop.toArray()) {
                if (!sv.isString())
                    return std::unexpected(badField(QStringLiteral("stop"),
                                                    QStringLiteral("a string or an array of strings")));
                sequences.append(sv.toString());
            }
            req.stop = sequences;
        } else {
            return std::unexpected(badField(QStringLiteral("stop"),
                                            QStringLiteral("a string or an array of strings")));
        }
    }

    auto maxTokens = optionalInt(root, QStringLiteral("max_tokens"));
    if (!maxTokens) return std::unexpected(maxTokens.error());
    req.maxTokens = *maxTokens;

    auto presence = optionalDouble(root, QStringLiteral("presence_penalty"));
    if (!presence) return std::unexpected(presence.error());
    req.presencePenalty = *presence;

    auto frequency = optionalDouble(root, QStringLiteral("frequency_penalty"));
    if (!frequency) return std::unexpected(frequency.error());
    req.frequencyPenalty = *frequency;

    auto user = optionalString(root, QStringLiteral("user"));
    if (!user) return std::unexpected(user.error());
    req.user = *user;

    const QJsonValue tools = root.value(QStringLiteral("tools"));
    if (!isUnset(tools)) {
        if (!tools.isArray())
            return std::unexpected(badField(QStringLiteral("tools"), QStringLiteral("an array")));
        req.tools = tools.toArray();
    }

    const QJsonValue toolChoice = root.value(QStringLiteral("tool_choice"));
    if (!isUnset(toolChoice))
        req.toolChoice = toolChoice;

    const QSet<QString>& known = knownRequestFields();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        if (!known.contains(it.key()))
            req.extra.insert(it.key(), it.value());
    }

    return req;
}

QJsonObject encodeMessage(const Message& message)
{
    QJsonObject obj;
    obj[QStringLiteral("role")] = message.role;
    obj[QStringLiteral("content")] = message.content;
    if (message.name)
        obj[QStringLiteral("name")] = *message.name;
    if (message.toolCalls)
        obj[QStringLiteral("tool_calls")] = *message.toolCalls;
    return obj;
}

QJsonObject encodeChatRequest(const ChatRequest& request)
{
    // Unrecognized fields first so a recognized field always wins on a clash.
    QJsonObject body = request.extra;

    body[QStringLiteral("model")] = request.model;

    QJsonArray messages;
    for (const Message& msg : request.messages)
        messages.append(encodeMessage(msg));
    body[QStringLiteral("messages")] = messages;

    if (request.temperature)
        body[QStringLiteral("temperature")] = *request.temperature;
    if (request.topP)
        body[QStringLiteral("top_p")] = *request.topP;
    if (request.n)
        body[QStringLiteral("n")] = *request.n;
    if (request.stream)
        body[QStringLiteral("stream")] = *request.stream;
    if (request.stop) {
        if (request.stopAsString && request.stop->size() == 1)
            body[QStringLiteral("stop")] = request.stop->first();
        else
            body[QStringLiteral("stop")] = QJsonArray::fromStringList(*request.stop);
    }
    if (request.maxTokens)
        body[QStringLiteral("max_tokens")] = *request.maxTokens;
    if (request.presencePenalty)
        body[QStringLiteral("presence_penalty")] = *request.presencePenalty;
    if (request.frequencyPenalty)
        body[QStringLiteral("frequency_penalty")] = *request.frequencyPenalty;
    if (request.user)
        body[QStringLiteral("user")] = *request.user;
    if (request.tools)
        body[QStringLiteral("tools")] = *request.tools;
    if (request.toolChoice)
        body[QStringLiteral("tool_choice")] = *request.toolChoice;

    return body;
}

std::expected<ChatResponse, QString> decodeChatResponse(const QJsonObject& root)
{
    ChatResponse resp;

    const QJsonValue id = root.value(QStringLiteral("id"));
    if (!id.isString())
        return std::unexpected(QStringLiteral("missing or non-string field 'id'"));
    resp.id = id.toString();

    const QJsonValue object = root.value(QStringLiteral("object"));
    if (!object.isString())
        return std::unexpected(QStringLiteral("missing or non-string field 'object'"));
    resp.object = object.toString();

    const QJsonValue created = root.value(QStringLiteral("created"));
    if (!isInteger(created))
        return std::unexpected(QStringLiteral("missing or non-integer field 'created'"));
    resp.created = created.toInteger();

    const QJsonValue model = root.value(QStringLiteral("model"));
    if (!model.isString())
        return std::unexpected(QStringLiteral("missing or non-string field 'model'"));
    resp.model = model.toString();

    const QJsonValue choices = root.value(QStringLiteral("choices"));
    if (!choices.isArray())
        return std::unexpected(QStringLiteral("missing or non-array field 'choices'"));
    const QJsonArray choiceArray = choices.toArray();
    for (int i = 0; i < choiceArray.size(); ++i) {
        const QJsonValue cv = choiceArray.at(i);
        if (!cv.isObject())
            return std::unexpected(QStringLiteral("choices[%1] is not an object").arg(i));
        const QJsonObject co = cv.toObject();

        Choice choice;
        const QJsonValue index = co.value(QStringLiteral("index"));
        if (!isInteger(index))
            return std::unexpected(QStringLiteral("choices[%1].index must be an integer").arg(i));
        choice.index = index.toInt();

        auto msg = decodeMessage(co.value(QStringLiteral("message")),
                                 QStringLiteral("choices[%1].message").arg(i));
        if (!msg)
            return std::unexpected(msg.error().message);
        choice.message = *msg;

        const QJsonValue finish = co.value(QStringLiteral("finish_reason"));
        if (!isUnset(finish)) {
            if (!finish.isString())
                return std::unexpected(QStringLiteral("choices[%1].finish_reason must be a string").arg(i));
            choice.finishReason = finish.toString();
        }
        resp.choices.append(choice);
    }

    const QJsonValue usage = root.value(QStringLiteral("usage"));
    if (!usage.isObject())
        return std::unexpected(QStringLiteral("missing or non-object field 'usage'"));
    const QJsonObject uo = usage.toObject();

    auto prompt = requireCount(uo, QStringLiteral("prompt_tokens"));
    if (!prompt) return std::unexpected(prompt.error());
    auto completion = requireCount(uo, QStringLiteral("completion_tokens"));
    if (!completion) return std::unexpected(completion.error());
    auto total = requireCount(uo, QStringLiteral("total_tokens"));
    if (!total) return std::unexpected(total.error());

    resp.usage.promptTokens = *prompt;
    resp.usage.completionTokens = *completion;
    resp.usage.totalTokens = *total;
    return resp;
}

QJsonObject encodeChatResponse(const ChatResponse& response)
{
    QJsonObject root;
    root[QStringLiteral("id")] = response.id;
    root[QStringLiteral("object")] = response.object;
    root[QStringLiteral("created")] = response.created;
    root[QStringLiteral("model")] = response.model;

    QJsonArray choices;
    for (const Choice& choice : response.choices) {
        QJsonObject co;
        co[QStringLiteral("index")] = choice.index;
        co[QStringLiteral("message")] = encodeMessage(choice.message);
        if (choice.finishReason)
            co[QStringLiteral("finish_reason")] = *choice.finishReason;
        choices.append(co);
    }
    root[QStringLiteral("choices")] = choices;

    QJsonObject usage;
    usage[QStringLiteral("prompt_tokens")] = static_cast<qint64>(response.usage.promptTokens);
    usage[QStringLiteral("completion_tokens")] = static_cast<qint64>(response.usage.completionTokens);
    usage[QStringLiteral("total_tokens")] = static_cast<qint64>(response.usage.totalTokens);
    root[QStringLiteral("usage")] = usage;

    return root;
}

Result<QByteArray> encodeChatChunk(const ChatChunk& chunk)
{
    if (chunk.delta.role && chunk.delta.content) {
        return std::unexpected(GatewayError::internal(
            QStringLiteral("chunk %1 carries both role and content").arg(chunk.id)));
    }
    if (chunk.id.isEmpty()) {
        return std::unexpected(GatewayError::internal(
            QStringLiteral("chunk has no identifier")));
    }

    QJsonObject delta;
    if (chunk.delta.role)
        delta[QStringLiteral("role")] = *chunk.delta.role;
    if (chunk.delta.content)
        delta[QStringLiteral("content")] = *chunk.delta.content;

    QJsonObject choice;
    choice[QStringLiteral("index")] = 0;
    choice[QStringLiteral("delta")] = delta;
    if (chunk.finishReason)
        choice[QStringLiteral("finish_reason")] = *chunk.finishReason;

    QJsonObject root;
    root[QStringLiteral("id")] = chunk.id;
    root[QStringLiteral("object")] = chunk.object;
    root[QStringLiteral("created")] = chunk.created;
    root[QStringLiteral("model")] = chunk.model;
    root[QStringLiteral("choices")] = QJsonArray{choice};

    return toCompactJson(root);
}

QJsonObject encodeModelList(const QList<ModelDescriptor>& models)
{
    QJsonArray data;
    for (const ModelDescriptor& model : models) {
        QJsonObject mo;
        mo[QStringLiteral("id")] = model.id;
        mo[QStringLiteral("object")] = model.object;
        mo[QStringLiteral("created")] = model.created;
        mo[QStringLiteral("owned_by")] = model.ownedBy;
        data.append(mo);
    }

    QJsonObject root;
    root[QStringLiteral("object")] = QStringLiteral("list");
    root[QStringLiteral("data")] = data;
    return root;
}

QByteArray toCompactJson(const QJsonObject& obj)
{
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

}
