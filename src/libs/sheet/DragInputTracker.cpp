// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/DragInputTracker.hpp"

#include "sheet/DragOffsetState.hpp"
#include "sheet/HeightTransform.hpp"

namespace Sheet {

DragInputTracker::DragInputTracker(DragOffsetState& state, const SheetConfig& config)
    : m_state(state)
    , m_config(config)
{
}

DragInputTracker::~DragInputTracker()
{
    if (m_active)
        closeSession();
}

bool DragInputTracker::begin(double pointerY, bool onHandle)
{
    if (!onHandle || m_active)
        return false;

    if (!m_state.acquire(OffsetWriter::Gesture))
        return false;

    m_active = true;
    m_pressPointerY = pointerY;
    m_pressOffset = m_state.value();
    return true;
}

void DragInputTracker::move(double pointerY)
{
    if (!m_active)
        return;

    const double next = HeightTransform::clampOffset(m_pressOffset + (pointerY - m_pressPointerY), m_config);
    if (next == m_state.value())
        return;

    if (!m_state.write(OffsetWriter::Gesture, next))
        qCDebug(sheetlog) << "drag move dropped at pointer y" << pointerY;
}

void DragInputTracker::end()
{
    if (m_active)
        closeSession();
}

void DragInputTracker::cancel()
{
    if (!m_active)
        return;
    qCDebug(sheetlog) << "gesture cancelled at offset" << m_state.value();
    closeSession();
}

void DragInputTracker::closeSession()
{
    m_active = false;
    m_state.release(OffsetWriter::Gesture);
}

} // namespace Sheet
