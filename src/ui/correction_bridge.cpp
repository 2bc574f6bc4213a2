// Copyright (c) 2025 VAM Desktop Live Whisper
// CorrectionBridge - Implementation

#include "ui/correction_bridge.hpp"
#include "app/runtime.hpp"
#include "app/summary.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

#include <QDebug>
#include <QMetaObject>
#include <QStringList>

CorrectionBridge::CorrectionBridge(QObject* parent)
    : QObject(parent)
    , runtime_(std::make_unique<app::Runtime>(core::get_config()))
{
    correction_level_ = QString::fromStdString(core::get_config().correction_level);

    // Log lines may come from any thread; marshal to the Qt main thread
    core::set_log_sink([this](core::LogLevel, const std::string& line) {
        const QString l = QString::fromStdString(line);
        QMetaObject::invokeMethod(this, [this, l]() {
            appendLog(l);
        }, Qt::QueuedConnection);
    });

    connect(&status_timer_, &QTimer::timeout, this, &CorrectionBridge::refreshStatus);
    status_timer_.start(1000);
    refreshStatus();
}

CorrectionBridge::~CorrectionBridge() {
    status_timer_.stop();
    joinWorker();
    core::set_log_sink({});
}

void CorrectionBridge::joinWorker() {
    if (worker_.joinable()) worker_.join();
}

//==============================================================================
// Property Setters
//==============================================================================

void CorrectionBridge::setCorrectionLevel(const QString& level) {
    if (correction_level_ != level) {
        correction_level_ = level;
        emit correctionLevelChanged();
    }
}

//==============================================================================
// Correction Control
//==============================================================================

void CorrectionBridge::correctText(const QString& text) {
    if (busy_) {
        qWarning() << "Correction already running!";
        return;
    }
    joinWorker();

    app::CorrectionOptions options;
    try {
        options = runtime_->correction_options();
        options.level = text::parse_correction_level(correction_level_.toStdString());
    } catch (const std::exception& e) {
        emit errorOccurred(QString::fromStdString(e.what()));
        return;
    }

    busy_ = true;
    progress_ = 0.0;
    progress_text_.clear();
    emit busyChanged();
    emit progressChanged();

    const std::string input = text.toStdString();
    worker_ = std::thread([this, input, options]() {
        app::CorrectionOutcome outcome;
        try {
            outcome = runtime_->pipeline().correct(input, options,
                [this](int done, int total, const std::string& status) {
                    const QString s = QString::fromStdString(status);
                    QMetaObject::invokeMethod(this, [this, done, total, s]() {
                        onProgress(done, total, s);
                    }, Qt::QueuedConnection);
                });
        } catch (const std::exception& e) {
            core::log_error(std::string("[ui] correction failed: ") + e.what());
            outcome.corrected_text = input;
            outcome.error = e.what();
        }
        QMetaObject::invokeMethod(this, [this, outcome]() {
            onFinished(outcome);
        }, Qt::QueuedConnection);
    });
}

void CorrectionBridge::releaseResources() {
    if (busy_) {
        qWarning() << "Cannot release while correcting";
        return;
    }
    runtime_->resources().release(resource::ResourceClass::Correction);
    runtime_->resources().release(resource::ResourceClass::Transcription);
    refreshStatus();
}

void CorrectionBridge::forceCleanup() {
    runtime_->resources().force_cleanup();
    refreshStatus();
}

void CorrectionBridge::clearLog() {
    log_text_.clear();
    emit logTextChanged();
}

//==============================================================================
// Callback Handlers (main thread)
//==============================================================================

void CorrectionBridge::onProgress(int done, int total, const QString& status) {
    progress_ = total > 0 ? static_cast<double>(done) / total : 0.0;
    progress_text_ = status;
    emit progressChanged();
}

void CorrectionBridge::onFinished(const app::CorrectionOutcome& outcome) {
    corrected_text_ = QString::fromStdString(outcome.corrected_text);
    result_summary_ = QString::fromStdString(app::format_outcome(outcome));
    busy_ = false;
    progress_ = 1.0;
    emit correctedTextChanged();
    emit progressChanged();
    emit busyChanged();
    if (!outcome.success) {
        emit errorOccurred(QString::fromStdString(outcome.error));
    }
    joinWorker();
    refreshStatus();
}

void CorrectionBridge::refreshStatus() {
    const resource::MetricsSnapshot m = runtime_->resources().metrics();
    QStringList active;
    for (auto cls : m.active) active << QString(resource::to_string(cls));
    loaded_resources_ = active.isEmpty() ? QString("none") : active.join(", ");
    memory_percent_ = m.memory_percent;
    available_gb_ = m.available_memory_gb;
    peak_gb_ = m.counters.peak_memory_gb;
    counters_ = QString("loads %1 · unloads %2 · swaps %3 · cleanups %4")
                    .arg(m.counters.loads)
                    .arg(m.counters.unloads)
                    .arg(m.counters.swaps)
                    .arg(m.counters.cleanups);
    availability_ = QString::fromStdString(app::format_availability(runtime_->availability()));
    emit statusChanged();
}

void CorrectionBridge::appendLog(const QString& line) {
    log_text_ += line;
    log_text_ += '\n';
    // keep the pane bounded
    if (log_text_.size() > 200000) log_text_ = log_text_.right(150000);
    emit logTextChanged();
}
