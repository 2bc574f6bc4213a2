// Copyright (c) 2025 VAM Desktop Live Whisper
// CorrectionBridge - Qt/QML bridge to the correction runtime

#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

#include <atomic>
#include <memory>
#include <thread>

namespace app {
    class Runtime;
    struct CorrectionOutcome;
}

class CorrectionBridge : public QObject {
    Q_OBJECT

    // Properties exposed to QML
    Q_PROPERTY(bool busy READ busy NOTIFY busyChanged)
    Q_PROPERTY(double progress READ progress NOTIFY progressChanged)
    Q_PROPERTY(QString progressText READ progressText NOTIFY progressChanged)
    Q_PROPERTY(QString correctionLevel READ correctionLevel WRITE setCorrectionLevel NOTIFY correctionLevelChanged)
    Q_PROPERTY(QString correctedText READ correctedText NOTIFY correctedTextChanged)
    Q_PROPERTY(QString resultSummary READ resultSummary NOTIFY correctedTextChanged)
    Q_PROPERTY(QString loadedResources READ loadedResources NOTIFY statusChanged)
    Q_PROPERTY(double memoryPercent READ memoryPercent NOTIFY statusChanged)
    Q_PROPERTY(double availableGb READ availableGb NOTIFY statusChanged)
    Q_PROPERTY(double peakGb READ peakGb NOTIFY statusChanged)
    Q_PROPERTY(QString counters READ counters NOTIFY statusChanged)
    Q_PROPERTY(QString availability READ availability NOTIFY statusChanged)
    Q_PROPERTY(QString logText READ logText NOTIFY logTextChanged)

public:
    explicit CorrectionBridge(QObject* parent = nullptr);
    ~CorrectionBridge();

    // Property getters
    bool busy() const { return busy_; }
    double progress() const { return progress_; }
    QString progressText() const { return progress_text_; }
    QString correctionLevel() const { return correction_level_; }
    QString correctedText() const { return corrected_text_; }
    QString resultSummary() const { return result_summary_; }
    QString loadedResources() const { return loaded_resources_; }
    double memoryPercent() const { return memory_percent_; }
    double availableGb() const { return available_gb_; }
    double peakGb() const { return peak_gb_; }
    QString counters() const { return counters_; }
    QString availability() const { return availability_; }
    QString logText() const { return log_text_; }

    // Property setters
    void setCorrectionLevel(const QString& level);

public slots:
    void correctText(const QString& text);
    void releaseResources();
    void forceCleanup();
    void refreshStatus();
    void clearLog();

signals:
    void busyChanged();
    void progressChanged();
    void correctionLevelChanged();
    void correctedTextChanged();
    void statusChanged();
    void logTextChanged();
    void errorOccurred(QString message);

private:
    void onProgress(int done, int total, const QString& status);
    void onFinished(const app::CorrectionOutcome& outcome);
    void appendLog(const QString& line);
    void joinWorker();

    std::unique_ptr<app::Runtime> runtime_;
    std::thread worker_;
    QTimer status_timer_;

    bool busy_ = false;
    double progress_ = 0.0;
    QString progress_text_;
    QString correction_level_ = "standard";
    QString corrected_text_;
    QString result_summary_;
    QString loaded_resources_;
    double memory_percent_ = 0.0;
    double available_gb_ = 0.0;
    double peak_gb_ = 0.0;
    QString counters_;
    QString availability_;
    QString log_text_;
};
