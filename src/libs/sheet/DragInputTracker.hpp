// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sheet/SheetConfig.hpp"
#include "sheet/SheetGlobal.hpp"

namespace Sheet {

class DragOffsetState;

// Turns a vertical pointer drag on the grab handle into drag offset writes.
//
// Pointer positions are absolute (screen) coordinates, so the handle moving
// together with the resized sheet does not feed back into the delta. The
// offset is clamped to the drag domain with no overshoot and no momentum: on
// release it stays where the last move left it.
class SHEET_EXPORT DragInputTracker final
{
public:
    DragInputTracker(DragOffsetState& state, const SheetConfig& config);
    ~DragInputTracker();

    DragInputTracker(const DragInputTracker&) = delete;
    DragInputTracker& operator=(const DragInputTracker&) = delete;

    // Fails when the press is not on the handle, a session is already active
    // or the offset is held by another writer.
    bool begin(double pointerY, bool onHandle);
    void move(double pointerY);
    void end();
    void cancel();

    bool isActive() const noexcept { return m_active; }

private:
    void closeSession();

    DragOffsetState& m_state;
    SheetConfig m_config;

    bool m_active = false;
    double m_pressPointerY = 0.0;
    double m_pressOffset = 0.0;
};

} // namespace Sheet
