// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/SheetController.hpp"

#include "sheet/HeightTransform.hpp"

#include <utility>

namespace Sheet {

const char* toString(SheetController::State state) noexcept
{
    switch (state) {
    case SheetController::State::Idle:
        return "idle";
    case SheetController::State::Dragging:
        return "dragging";
    case SheetController::State::Animating:
        return "animating";
    }
    return "unknown";
}

SheetConfig SheetController::validated(const SheetConfig& config)
{
    const Utils::Result r = config.validate();
    if (!r) {
        qCWarning(sheetlog).noquote() << "rejecting sheet configuration:" << r.joined();
        throw ConfigError(r);
    }
    return config;
}

SheetController::SheetController(const SheetConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(validated(config))
    , m_offset(0.0)
    , m_emitter(m_offset, m_config)
    , m_tracker(m_offset, m_config)
    , m_animator(m_offset, m_config.spring)
{
    connect(&m_animator, &SpringAnimator::settled, this, [this](double) {
        if (m_state == State::Animating)
            setState(State::Idle);
    });

    connect(&m_cancelHandler, &KeyboardCancelHandler::cancelRequested, this, &SheetController::cancel);
}

SheetController::~SheetController()
{
    // Members tear down in reverse order, but stop the spring explicitly so no
    // frame lands on a half-destroyed controller.
    m_animator.blockSignals(true);
    m_animator.stop();
    m_tracker.cancel();
}

HeightChangeEmitter::Subscription SheetController::subscribe(HeightChangeEmitter::Callback callback)
{
    return m_emitter.subscribe(std::move(callback));
}

bool SheetController::pointerDown(double pointerY, bool onHandle)
{
    if (!onHandle)
        return false;

    if (m_state == State::Animating) {
        m_animator.stop();
        setState(State::Idle);
    }

    if (!m_tracker.begin(pointerY, onHandle))
        return false;

    setState(State::Dragging);
    return true;
}

void SheetController::pointerMove(double pointerY)
{
    if (m_state != State::Dragging)
        return;
    m_tracker.move(pointerY);
}

void SheetController::pointerUp()
{
    if (m_state != State::Dragging)
        return;
    m_tracker.end();
    setState(State::Idle);
}

void SheetController::pointerCancel()
{
    if (m_state != State::Dragging)
        return;
    m_tracker.cancel();
    setState(State::Idle);
}

void SheetController::cancel()
{
    qCDebug(sheetlog) << "cancel requested in state" << toString(m_state);

    if (animateTo(m_config.minimizedOffset()))
        emit closeRequested();
}

void SheetController::snapToHeight(double height)
{
    animateTo(HeightTransform::offsetForHeight(height, m_config));
}

bool SheetController::animateTo(double offset)
{
    if (m_state == State::Dragging)
        m_tracker.end();

    if (!m_animator.start(offset)) {
        qCWarning(sheetlog) << "snap to offset" << offset << "refused";
        setState(State::Idle);
        return false;
    }

    setState(State::Animating);
    return true;
}

void SheetController::setState(State state)
{
    if (m_state == state)
        return;

    qCDebug(sheetlog) << "sheet state" << toString(m_state) << "->" << toString(state);
    m_state = state;
    emit stateChanged(state);
}

} // namespace Sheet
