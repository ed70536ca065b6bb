// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dash/gui/dash_spinner.hpp>
#include <dash/core/config.hpp>

#include <QDebug>
#include <QFontMetricsF>
#include <QPainter>
#include <QPaintEvent>
#include <QResizeEvent>
#include <QTimer>
#include <algorithm>
#include <chrono>
#include <utility>

namespace dash::gui {

namespace {

constexpr int DEFAULT_SIZE = 120;
constexpr int MIN_SIZE = 32;
constexpr int MEASURE_REFERENCE_SIZE = 100;  // px; widths scale linearly from here

QColor to_qcolor(core::Argb c) {
    return QColor::fromRgba(c);
}

QPointF to_qpoint(core::PointF p) {
    return {p.x, p.y};
}

QString mode_name(core::DashMode mode) {
    auto name = core::to_string(mode);
    return QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size()));
}

QFont progress_font(const QFont& base) {
    QFont font = base;
    font.setWeight(QFont::Light);
    return font;
}

void paint_circle(QPainter& painter, const core::CircleShape& circle) {
    if (circle.radius <= 0.0f) return;

    if (!circle.filled) {
        if (circle.stroke_width <= 0.0f) return;
        painter.setPen(QPen(to_qcolor(circle.color), circle.stroke_width));
        painter.setBrush(Qt::NoBrush);
    } else {
        painter.setPen(Qt::NoPen);
        painter.setBrush(to_qcolor(circle.color));
    }
    painter.drawEllipse(to_qpoint(circle.center), circle.radius, circle.radius);
}

} // namespace

DashSpinner::DashSpinner(QWidget* parent)
    : DashSpinner(core::SpinnerStyle{}, parent) {
}

DashSpinner::DashSpinner(core::SpinnerStyle style, QWidget* parent)
    : QWidget(parent)
    , style_(std::move(style))
    , state_(style_.arc_start_position)
    , ticker_(new QTimer(this)) {

    setSizePolicy(QSizePolicy::Preferred, QSizePolicy::Preferred);

    ticker_->setTimerType(Qt::PreciseTimer);
    ticker_->setInterval(static_cast<int>(core::FRAME_INTERVAL.count()));
    connect(ticker_, &QTimer::timeout, this, &DashSpinner::on_tick);

    state_.on_complete([this](core::DashMode mode) {
        qDebug().noquote() << "DashSpinner: cycle" << state_.cycle() << "finished as" << mode_name(mode);
        emit download_intimation_done(mode);
    });

    update_geometry();
}

DashSpinner::~DashSpinner() = default;

QSize DashSpinner::sizeHint() const {
    return {DEFAULT_SIZE, DEFAULT_SIZE};
}

QSize DashSpinner::minimumSizeHint() const {
    return {MIN_SIZE, MIN_SIZE};
}

void DashSpinner::set_progress(float progress) {
    if (state_.set_progress(progress)) {
        update();
    }
}

void DashSpinner::show_success() {
    start_transition(core::DashMode::success);
}

void DashSpinner::show_failure() {
    start_transition(core::DashMode::failure);
}

void DashSpinner::show_unknown() {
    start_transition(core::DashMode::unknown);
}

void DashSpinner::reset_values() {
    ticker_->stop();
    state_.reset();
    update_geometry();
    qDebug().noquote() << "DashSpinner: reset, cycle" << state_.cycle();
    update();
}

void DashSpinner::start_transition(core::DashMode terminal) {
    if (state_.animating()) {
        qDebug().noquote() << "DashSpinner: restarting transition from" << mode_name(state_.mode());
    }

    state_.show(terminal);
    qDebug().noquote() << "DashSpinner: cycle" << state_.cycle() << "transition to" << mode_name(terminal)
                       << "at progress" << state_.progress();
    start_ticker();
    update();
}

void DashSpinner::start_ticker() {
    clock_.start();
    if (!ticker_->isActive()) {
        ticker_->start();
    }
}

void DashSpinner::on_tick() {
    const std::chrono::milliseconds elapsed{clock_.restart()};

    if (state_.advance(elapsed)) {
        update();
    }

    // The completion signal may have restarted the spinner
    if (!state_.animating()) {
        ticker_->stop();
    }
}

void DashSpinner::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    update_geometry();
}

void DashSpinner::update_geometry() {
    geometry_ = core::Geometry::from_bounds(width(), height(), style_.ring_width);
}

float DashSpinner::measure_text(std::string_view text, float size) const {
    QFont font = progress_font(this->font());
    font.setPixelSize(MEASURE_REFERENCE_SIZE);
    QFontMetricsF metrics(font);

    const auto str = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
    return static_cast<float>(metrics.horizontalAdvance(str) * size / MEASURE_REFERENCE_SIZE);
}

void DashSpinner::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::TextAntialiasing);

    // Geometry describes a square anchored at the origin; center it
    painter.translate((width() - geometry_.size) / 2.0, (height() - geometry_.size) / 2.0);

    state_.advance_arc(style_.arc_sweep_speed);

    const auto frame = core::build_frame(state_, geometry_, style_,
        [this](std::string_view text, float size) { return measure_text(text, size); });
    paint_frame(painter, frame);
}

void DashSpinner::paint_frame(QPainter& painter, const core::FrameState& frame) const {
    paint_circle(painter, frame.ring);
    paint_circle(painter, frame.inner_circle);

    if (frame.text) {
        QFont font = progress_font(this->font());
        font.setPixelSize(std::max(1, qRound(frame.text->size)));
        painter.setFont(font);
        painter.setPen(to_qcolor(frame.text->color));

        QRectF box(0, 0, geometry_.size, geometry_.size);
        box.moveCenter(to_qpoint(frame.text->center));
        painter.drawText(box, Qt::AlignCenter, QString::fromStdString(frame.text->text));
    }

    if (!frame.lines.empty()) {
        painter.setPen(QPen(to_qcolor(frame.line_color), frame.line_stroke, Qt::SolidLine, Qt::RoundCap));
        painter.setBrush(Qt::NoBrush);
        for (const auto& line : frame.lines) {
            painter.drawLine(to_qpoint(line.from), to_qpoint(line.to));
        }
    }

    for (const auto& dot : frame.dots) {
        paint_circle(painter, dot);
    }

    if (frame.arc) {
        const auto& arc = *frame.arc;
        QRectF bounds(arc.center.x - arc.radius, arc.center.y - arc.radius, arc.radius * 2, arc.radius * 2);

        painter.setPen(QPen(to_qcolor(arc.color), arc.stroke_width, Qt::SolidLine, Qt::RoundCap));
        painter.setBrush(Qt::NoBrush);
        // Qt measures counter-clockwise in 1/16th degrees
        painter.drawArc(bounds, qRound(-arc.start_angle * 16), qRound(-arc.sweep_angle * 16));
    }
}

} // namespace dash::gui
