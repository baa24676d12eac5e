// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sheet/SheetConfig.hpp"
#include "sheet/SheetGlobal.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QObject>
#include <QtCore/QTimer>

namespace Sheet {

class DragOffsetState;

// Drives a DragOffsetState toward a target with a damped spring, one frame at
// a time. While running it holds the Animation writer on the offset.
class SHEET_EXPORT SpringAnimator final : public QObject
{
    Q_OBJECT

public:
    static constexpr int kFrameIntervalMs = 16;

    SpringAnimator(DragOffsetState& state, const SpringParams& params, QObject* parent = nullptr);
    ~SpringAnimator() override;

    // Starts from the current offset with zero velocity. Returns false when
    // the offset is owned by another writer.
    bool start(double target);
    // Changes the target of a running animation, keeping the velocity.
    void retarget(double target);
    // Freezes the offset at its current animated value.
    void stop();

    // Advances one frame. Returns true while still running. Also used by the
    // frame clock; callable directly to drive the spring deterministically.
    bool step(double dtSeconds);

    bool isRunning() const noexcept { return m_running; }
    double target() const noexcept { return m_target; }
    double velocity() const noexcept { return m_velocity; }

    // Off by default in tests that drive step() by hand.
    void setFrameClockEnabled(bool enabled);
    bool isFrameClockEnabled() const noexcept { return m_clockEnabled; }

signals:
    void settled(double offset);
    void interrupted(double offset);

private:
    void onFrame();
    void finish();

    DragOffsetState& m_state;
    SpringParams m_params;

    QTimer m_frameTimer;
    QElapsedTimer m_frameClock;
    bool m_clockEnabled = true;

    bool m_running = false;
    double m_position = 0.0;
    double m_velocity = 0.0;
    double m_target = 0.0;
};

} // namespace Sheet
