// Copyright (c) 2025 VAM Desktop Live Whisper
// Main entry point for Qt GUI application

#include <QGuiApplication>
#include <QQmlApplicationEngine>

#include "ui/correction_bridge.hpp"

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);

    // Register CorrectionBridge type for QML
    qmlRegisterType<CorrectionBridge>("App", 1, 0, "CorrectionBridge");

    QQmlApplicationEngine engine;
    engine.loadFromModule("App", "Main");

    if (engine.rootObjects().isEmpty()) {
        return -1;
    }

    return app.exec();
}
