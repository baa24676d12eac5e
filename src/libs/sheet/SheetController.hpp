// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sheet/DragInputTracker.hpp"
#include "sheet/DragOffsetState.hpp"
#include "sheet/HeightChangeEmitter.hpp"
#include "sheet/KeyboardCancelHandler.hpp"
#include "sheet/SheetConfig.hpp"
#include "sheet/SheetGlobal.hpp"
#include "sheet/SpringAnimator.hpp"

#include <QtCore/QObject>

namespace Sheet {

// Gesture engine of one mounted sheet: owns the drag offset and arbitrates it
// between the user's drag and the snap animation.
//
//   Idle      -> Dragging   handle pointer-down
//   Dragging  -> Idle       pointer-up / pointer-cancel
//   Idle      -> Animating  cancel key (Dragging too; the gesture ends first)
//   Animating -> Idle       spring settled
//   Animating -> Idle       handle pointer-down (animation frozen in place),
//                           immediately followed by Idle -> Dragging
//
// Destroying the controller tears everything down from any state.
class SHEET_EXPORT SheetController final : public QObject
{
    Q_OBJECT

public:
    enum class State : unsigned char {
        Idle,
        Dragging,
        Animating
    };
    Q_ENUM(State)

    // Throws ConfigError when `config` does not validate.
    explicit SheetController(const SheetConfig& config, QObject* parent = nullptr);
    ~SheetController() override;

    const SheetConfig& config() const noexcept { return m_config; }
    State state() const noexcept { return m_state; }

    double offset() const noexcept { return m_offset.value(); }
    double height() const noexcept { return m_emitter.currentHeight(); }

    [[nodiscard]] HeightChangeEmitter::Subscription subscribe(HeightChangeEmitter::Callback callback);

    bool pointerDown(double pointerY, bool onHandle = true);
    void pointerMove(double pointerY);
    void pointerUp();
    void pointerCancel();

    // What the cancel key does: snap to minHeight and request close.
    void cancel();

    // Animated programmatic height request; out-of-range heights are clamped.
    void snapToHeight(double height);

    SpringAnimator& animator() noexcept { return m_animator; }
    const KeyboardCancelHandler& cancelHandler() const noexcept { return m_cancelHandler; }

signals:
    void stateChanged(Sheet::SheetController::State state);
    void closeRequested();

private:
    static SheetConfig validated(const SheetConfig& config);

    void setState(State state);
    bool animateTo(double offset);

    const SheetConfig m_config;
    State m_state = State::Idle;

    DragOffsetState m_offset;
    HeightChangeEmitter m_emitter;
    DragInputTracker m_tracker;
    SpringAnimator m_animator;
    KeyboardCancelHandler m_cancelHandler;
};

SHEET_EXPORT const char* toString(SheetController::State state) noexcept;

} // namespace Sheet
