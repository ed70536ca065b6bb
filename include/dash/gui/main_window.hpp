// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dash/core/dash_mode.hpp>
#include <dash/core/spinner_style.hpp>
#include <QMainWindow>

class QPushButton;
class QLabel;
class QTimer;

namespace dash::gui {

class DashSpinner;

// Demo host: replays a successful, a failed and an unknown download
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(core::SpinnerStyle style = {}, QWidget* parent = nullptr);
    ~MainWindow() override;

    [[nodiscard]] DashSpinner* spinner() const noexcept { return spinner_; }

private slots:
    void on_success_clicked();
    void on_failure_clicked();
    void on_unknown_clicked();
    void on_progress_tick();
    void on_intimation_done(dash::core::DashMode mode);

private:
    // Where a simulated download stops and which outcome it reports
    struct Run {
        float stop_at{1.0f};
        core::DashMode outcome{core::DashMode::success};
    };

    void setup_ui(core::SpinnerStyle style);
    void setup_status_bar();
    void start_run(Run run);

    DashSpinner* spinner_{nullptr};

    QPushButton* btn_success_{nullptr};
    QPushButton* btn_failure_{nullptr};
    QPushButton* btn_unknown_{nullptr};

    QLabel* status_mode_{nullptr};

    QTimer* progress_timer_{nullptr};
    Run run_;
    float simulated_progress_{0.0f};
};

} // namespace dash::gui
