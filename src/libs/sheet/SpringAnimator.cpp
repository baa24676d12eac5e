// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/SpringAnimator.hpp"

#include "sheet/DragOffsetState.hpp"

#include <algorithm>
#include <cmath>

namespace Sheet {

namespace {

constexpr double kMaxSubstepSeconds = 0.001;
// Frames longer than this (debugger, stalled event loop) are treated as this.
constexpr double kMaxFrameSeconds = 0.064;

} // namespace

SpringAnimator::SpringAnimator(DragOffsetState& state, const SpringParams& params, QObject* parent)
    : QObject(parent)
    , m_state(state)
    , m_params(params)
{
    m_frameTimer.setInterval(kFrameIntervalMs);
    m_frameTimer.setTimerType(Qt::PreciseTimer);
    connect(&m_frameTimer, &QTimer::timeout, this, &SpringAnimator::onFrame);
}

SpringAnimator::~SpringAnimator()
{
    m_frameTimer.stop();
    if (m_running)
        m_state.release(OffsetWriter::Animation);
}

bool SpringAnimator::start(double target)
{
    if (m_running) {
        retarget(target);
        return true;
    }

    if (!m_state.acquire(OffsetWriter::Animation))
        return false;

    m_running = true;
    m_position = m_state.value();
    m_velocity = 0.0;
    m_target = target;

    qCDebug(sheetlog) << "spring start" << m_position << "->" << m_target;

    if (m_clockEnabled) {
        m_frameClock.start();
        m_frameTimer.start();
    }
    return true;
}

void SpringAnimator::retarget(double target)
{
    if (!m_running)
        return;
    m_target = target;
}

void SpringAnimator::stop()
{
    if (!m_running)
        return;

    m_frameTimer.stop();
    m_running = false;
    m_velocity = 0.0;
    m_state.release(OffsetWriter::Animation);

    qCDebug(sheetlog) << "spring interrupted at" << m_position;
    emit interrupted(m_position);
}

bool SpringAnimator::step(double dtSeconds)
{
    if (!m_running)
        return false;

    double remaining = std::clamp(dtSeconds, 0.0, kMaxFrameSeconds);
    while (remaining > 0.0) {
        const double h = std::min(remaining, kMaxSubstepSeconds);
        const double springForce = -m_params.stiffness * (m_position - m_target);
        const double dampingForce = -m_params.damping * m_velocity;
        m_velocity += (springForce + dampingForce) / m_params.mass * h;
        m_position += m_velocity * h;
        remaining -= h;
    }

    const bool atRest = std::abs(m_position - m_target) < m_params.restDelta
                        && std::abs(m_velocity) < m_params.restSpeed;
    if (atRest) {
        m_position = m_target;
        m_velocity = 0.0;
    }

    if (!m_state.write(OffsetWriter::Animation, m_position)) {
        m_position = m_state.value();
        stop();
        return false;
    }

    if (atRest)
        finish();

    return m_running;
}

void SpringAnimator::setFrameClockEnabled(bool enabled)
{
    m_clockEnabled = enabled;
    if (!enabled) {
        m_frameTimer.stop();
    } else if (m_running && !m_frameTimer.isActive()) {
        m_frameClock.start();
        m_frameTimer.start();
    }
}

void SpringAnimator::onFrame()
{
    const double dt = double(m_frameClock.restart()) / 1000.0;
    step(dt);
}

void SpringAnimator::finish()
{
    m_frameTimer.stop();
    m_running = false;
    m_state.release(OffsetWriter::Animation);

    qCDebug(sheetlog) << "spring settled at" << m_position;
    emit settled(m_position);
}

} // namespace Sheet
