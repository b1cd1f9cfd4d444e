#pragma once
#include "wire/types.h"
#include <QObject>
#include <QStringList>
#include <QTimer>

// Replays one complete reply text as a paced chat.completion.chunk sequence:
// role chunk, one chunk per interior word, terminal chunk. Empty text yields
// the role chunk alone. Not restartable.
class StreamEmulator : public QObject {
    Q_OBJECT
public:
    StreamEmulator(const QString& text, const QString& model,
                   int delayMs = 20, QObject* parent = nullptr);
    ~StreamEmulator() override;

    // Emits the role chunk immediately, the rest on the pacing timer.
    void start();
    void abort();

    bool isRunning() const { return m_started && !m_done; }
    bool isFinished() const { return m_done; }
    QString chunkId() const { return m_chunkId; }
    qint64 created() const { return m_created; }
    int stepCount() const { return m_lastStep + 1; }

    static QStringList splitWords(const QString& text);
    // Serialized chunk, or the serialization_error placeholder event.
    static QByteArray encodeOrPlaceholder(const ChatChunk& chunk);

signals:
    void chunkReady(const QByteArray& json);
    void finished();

private slots:
    void emitNextStep();

private:
    ChatChunk chunkForStep(int step) const;

    QStringList m_words;
    QString m_model;
    QString m_chunkId;
    qint64 m_created = 0;
    int m_step = 0;
    int m_lastStep = 1;
    bool m_started = false;
    bool m_done = false;
    QTimer m_timer;
};
