// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dash/gui/main_window.hpp>
#include <dash/gui/dash_spinner.hpp>
#include <dash/version.hpp>

#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>

namespace dash::gui {

namespace {

constexpr int PROGRESS_INTERVAL_MS = 30;
constexpr float PROGRESS_STEP = 0.01f;
constexpr int STATUS_MESSAGE_MS = 2000;
constexpr int SPINNER_SIZE = 160;

QString modern_button_style() {
    return R"(
        QPushButton {
            background-color: #3a3a3a;
            border: 1px solid #555;
            border-radius: 4px;
            padding: 6px 16px;
            color: #eee;
            font-weight: 500;
        }
        QPushButton:hover {
            background-color: #4a4a4a;
            border-color: #666;
        }
        QPushButton:pressed {
            background-color: #2a2a2a;
        }
    )";
}

} // namespace

MainWindow::MainWindow(core::SpinnerStyle style, QWidget* parent)
    : QMainWindow(parent)
    , progress_timer_(new QTimer(this)) {

    setWindowTitle(QString("Dash Spinner %1").arg(dash::version.to_string().c_str()));
    resize(360, 420);

    setup_ui(std::move(style));
    setup_status_bar();

    progress_timer_->setInterval(PROGRESS_INTERVAL_MS);
    connect(progress_timer_, &QTimer::timeout, this, &MainWindow::on_progress_tick);
}

MainWindow::~MainWindow() = default;

void MainWindow::setup_ui(core::SpinnerStyle style) {
    auto* central = new QWidget(this);
    setCentralWidget(central);

    auto* main_layout = new QVBoxLayout(central);
    main_layout->setContentsMargins(24, 24, 24, 24);

    spinner_ = new DashSpinner(std::move(style), central);
    spinner_->setMinimumSize(SPINNER_SIZE, SPINNER_SIZE);
    main_layout->addWidget(spinner_, 1, Qt::AlignCenter);

    auto* button_layout = new QHBoxLayout();
    button_layout->addStretch();

    btn_success_ = new QPushButton("Success", central);
    btn_success_->setStyleSheet(modern_button_style());
    connect(btn_success_, &QPushButton::clicked, this, &MainWindow::on_success_clicked);
    button_layout->addWidget(btn_success_);

    btn_failure_ = new QPushButton("Failure", central);
    btn_failure_->setStyleSheet(modern_button_style());
    connect(btn_failure_, &QPushButton::clicked, this, &MainWindow::on_failure_clicked);
    button_layout->addWidget(btn_failure_);

    btn_unknown_ = new QPushButton("Unknown", central);
    btn_unknown_->setStyleSheet(modern_button_style());
    connect(btn_unknown_, &QPushButton::clicked, this, &MainWindow::on_unknown_clicked);
    button_layout->addWidget(btn_unknown_);

    button_layout->addStretch();
    main_layout->addLayout(button_layout);

    connect(spinner_, &DashSpinner::download_intimation_done, this, &MainWindow::on_intimation_done);
}

void MainWindow::setup_status_bar() {
    status_mode_ = new QLabel("Idle", this);
    status_mode_->setStyleSheet("color: #aaa;");
    statusBar()->addPermanentWidget(status_mode_);
}

void MainWindow::on_success_clicked() {
    start_run({1.0f, core::DashMode::success});
}

void MainWindow::on_failure_clicked() {
    start_run({0.5f, core::DashMode::failure});
}

void MainWindow::on_unknown_clicked() {
    // No download at all, straight to the outcome
    progress_timer_->stop();
    spinner_->reset_values();
    simulated_progress_ = 0.0f;
    status_mode_->setText("Unknown");
    spinner_->show_unknown();
}

void MainWindow::start_run(Run run) {
    spinner_->reset_values();
    simulated_progress_ = 0.0f;
    run_ = run;
    status_mode_->setText("Downloading");
    progress_timer_->start();
}

void MainWindow::on_progress_tick() {
    simulated_progress_ += PROGRESS_STEP;
    spinner_->set_progress(simulated_progress_);

    if (simulated_progress_ <= run_.stop_at) return;

    progress_timer_->stop();
    if (run_.outcome == core::DashMode::success) {
        spinner_->show_success();
    } else {
        spinner_->show_failure();
    }
}

void MainWindow::on_intimation_done(dash::core::DashMode mode) {
    switch (mode) {
        case core::DashMode::success:
            statusBar()->showMessage("Download Successful!", STATUS_MESSAGE_MS);
            status_mode_->setText("Success");
            break;
        case core::DashMode::failure:
            statusBar()->showMessage("Download Failed!", STATUS_MESSAGE_MS);
            status_mode_->setText("Failure");
            break;
        case core::DashMode::unknown:
            statusBar()->showMessage("Unknown Download Error!", STATUS_MESSAGE_MS);
            status_mode_->setText("Unknown");
            break;
        default:
            break;
    }
}

} // namespace dash::gui
