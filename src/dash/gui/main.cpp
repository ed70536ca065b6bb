// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dash/gui/main_window.hpp>
#include <dash/core/spinner_style.hpp>
#include <dash/version.hpp>

#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QStyleFactory>

namespace {

void apply_default_style() {
    QApplication::setStyle(QStyleFactory::create("Fusion"));

    // Dark palette
    QPalette dark;
    dark.setColor(QPalette::Window, QColor(30, 30, 30));
    dark.setColor(QPalette::WindowText, QColor(220, 220, 220));
    dark.setColor(QPalette::Base, QColor(25, 25, 25));
    dark.setColor(QPalette::Text, QColor(220, 220, 220));
    dark.setColor(QPalette::Button, QColor(45, 45, 45));
    dark.setColor(QPalette::ButtonText, QColor(220, 220, 220));
    dark.setColor(QPalette::Highlight, QColor(42, 130, 218));
    dark.setColor(QPalette::HighlightedText, QColor(30, 30, 30));

    QApplication::setPalette(dark);
}

dash::core::SpinnerStyle load_style(const QString& path) {
    if (path.isEmpty()) {
        return {};
    }

    auto result = dash::core::SpinnerStyle::load(path.toStdString());
    if (!result) {
        qWarning().noquote() << "Failed to load style" << path << ":"
                             << QString::fromStdString(result.error().message())
                             << "- using defaults";
        return {};
    }
    return *result;
}

} // namespace

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);

    app.setApplicationName("DashSpinner");
    app.setApplicationDisplayName("Dash Spinner");
    app.setApplicationVersion(dash::version.to_string().c_str());
    app.setOrganizationName("changcheng967");

    QCommandLineParser parser;
    parser.setApplicationDescription("Animated download status indicator demo");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption style_option("style", "Load spinner colors and sizes from a JSON <file>.", "file");
    QCommandLineOption text_option("show-progress-text", "Draw the percentage inside the spinner.");
    parser.addOption(style_option);
    parser.addOption(text_option);
    parser.process(app);

    auto style = load_style(parser.value(style_option));
    if (parser.isSet(text_option)) {
        style.show_progress_text = true;
    }

    apply_default_style();

    dash::gui::MainWindow window(std::move(style));
    window.show();

    return app.exec();
}
