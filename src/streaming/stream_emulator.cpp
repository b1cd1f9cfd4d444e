#include "stream_emulator.h"
#include "wire/codec.h"
#include "wire/identifiers.h"
#include "core/log_manager.h"
#include <QJsonObject>
#include <QRegularExpression>

StreamEmulator::StreamEmulator(const QString& text, const QString& model,
                               int delayMs, QObject* parent)
    : QObject(parent)
    , m_words(splitWords(text))
    , m_model(model)
    , m_lastStep(static_cast<int>(m_words.size()))
{
    m_timer.setInterval(qMax(0, delayMs));
    m_timer.setSingleShot(false);
    connect(&m_timer, &QTimer::timeout, this, &StreamEmulator::emitNextStep);
}

StreamEmulator::~StreamEmulator()
{
    m_timer.stop();
}

QStringList StreamEmulator::splitWords(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    QStringList words = text.split(whitespace, Qt::SkipEmptyParts);
    for (QString& word : words)
        word.append(QLatin1Char(' '));
    return words;
}

QByteArray StreamEmulator::encodeOrPlaceholder(const ChatChunk& chunk)
{
    auto encoded = wire_codec::encodeChatChunk(chunk);
    if (encoded)
        return *encoded;

    LOG_ERROR(QStringLiteral("StreamEmulator: chunk %1 not serializable: %2")
                  .arg(chunk.id, encoded.error().message));
    QJsonObject error;
    error.insert(QStringLiteral("message"), QStringLiteral("Failed to serialize stream chunk"));
    error.insert(QStringLiteral("type"), QStringLiteral("serialization_error"));
    QJsonObject root;
    root.insert(QStringLiteral("error"), error);
    return wire_codec::toCompactJson(root);
}

ChatChunk StreamEmulator::chunkForStep(int step) const
{
    ChatChunk chunk;
    chunk.id = m_chunkId;
    chunk.created = m_created;
    chunk.model = m_model;

    if (step == 0) {
        chunk.delta.role = QStringLiteral("assistant");
    } else if (step < m_lastStep) {
        // Interior step i carries the zero-based word i.
        chunk.delta.content = m_words.at(step);
    } else {
        chunk.finishReason = QStringLiteral("stop");
    }
    return chunk;
}

void StreamEmulator::start()
{
    if (m_started) {
        LOG_WARNING(QStringLiteral("StreamEmulator: start() called twice, ignored"));
        return;
    }
    m_started = true;
    m_chunkId = wire_ids::generateChatId();
    m_created = wire_ids::currentTimestamp();
    m_step = 0;

    LOG_DEBUG(QStringLiteral("StreamEmulator: %1 streaming %2 words in %3 chunks")
                  .arg(m_chunkId).arg(m_words.size()).arg(stepCount()));

    emit chunkReady(encodeOrPlaceholder(chunkForStep(m_step)));
    if (m_done)
        return;   // aborted from a chunkReady receiver
    m_timer.start();
}

void StreamEmulator::emitNextStep()
{
    if (m_done)
        return;

    // Empty text: the role chunk was the whole sequence.
    if (m_lastStep == 0) {
        m_timer.stop();
        m_done = true;
        emit finished();
        return;
    }

    ++m_step;
    const bool terminal = m_step >= m_lastStep;
    if (terminal) {
        m_timer.stop();
        m_done = true;
    }

    emit chunkReady(encodeOrPlaceholder(chunkForStep(m_step)));
    if (terminal)
        emit finished();
}

void StreamEmulator::abort()
{
    if (m_done)
        return;
    m_timer.stop();
    m_done = true;
    LOG_DEBUG(QStringLiteral("StreamEmulator: %1 aborted at step %2").arg(m_chunkId).arg(m_step));
}
