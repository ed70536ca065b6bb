// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dash/core/dash_mode.hpp>
#include <dash/core/frame.hpp>
#include <dash/core/geometry.hpp>
#include <dash/core/spinner_state.hpp>
#include <dash/core/spinner_style.hpp>

#include <QElapsedTimer>
#include <QWidget>

#include <string_view>

class QPainter;
class QTimer;

namespace dash::gui {

// Circular progress indicator. Shows externally reported progress, then
// animates into a tick, cross or exclamation mark when told how things ended.
class DashSpinner : public QWidget {
    Q_OBJECT

public:
    explicit DashSpinner(QWidget* parent = nullptr);
    explicit DashSpinner(core::SpinnerStyle style, QWidget* parent = nullptr);
    ~DashSpinner() override;

    // Ignored once a terminal transition has started
    void set_progress(float progress);

    void show_success();
    void show_failure();
    void show_unknown();

    void reset_values();

    [[nodiscard]] core::DashMode mode() const noexcept { return state_.mode(); }
    [[nodiscard]] core::DashMode next_mode() const noexcept { return state_.next_mode(); }
    [[nodiscard]] float progress() const noexcept { return state_.progress(); }
    [[nodiscard]] float transition_progress() const noexcept { return state_.transition_progress(); }
    [[nodiscard]] float arc_position() const noexcept { return state_.arc_position(); }
    [[nodiscard]] bool animating() const noexcept { return state_.animating(); }
    [[nodiscard]] const core::SpinnerStyle& style() const noexcept { return style_; }
    [[nodiscard]] const core::Geometry& geometry() const noexcept { return geometry_; }

    [[nodiscard]] QSize sizeHint() const override;
    [[nodiscard]] QSize minimumSizeHint() const override;

signals:
    // Emitted once per completed cycle, after the final animation has settled
    void download_intimation_done(dash::core::DashMode mode);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

private slots:
    void on_tick();

private:
    void start_transition(core::DashMode terminal);
    void start_ticker();
    void update_geometry();
    void paint_frame(QPainter& painter, const core::FrameState& frame) const;
    [[nodiscard]] float measure_text(std::string_view text, float size) const;

    core::SpinnerStyle style_;
    core::SpinnerState state_;
    core::Geometry geometry_;

    QTimer* ticker_{nullptr};
    QElapsedTimer clock_;
};

} // namespace dash::gui
