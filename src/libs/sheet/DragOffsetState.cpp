// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/DragOffsetState.hpp"

#include <QtCore/QScopeGuard>

#include <cmath>
#include <utility>

namespace Sheet {

const char* toString(OffsetWriter writer) noexcept
{
    switch (writer) {
    case OffsetWriter::None:
        return "none";
    case OffsetWriter::Gesture:
        return "gesture";
    case OffsetWriter::Animation:
        return "animation";
    }
    return "unknown";
}

DragOffsetState::DragOffsetState(double initial) noexcept
    : m_value(std::isfinite(initial) ? initial : 0.0)
{
}

bool DragOffsetState::acquire(OffsetWriter writer)
{
    if (writer == OffsetWriter::None)
        return false;

    if (m_owner != OffsetWriter::None && m_owner != writer) {
        qCWarning(sheetlog) << "offset acquire by" << toString(writer)
                            << "refused; held by" << toString(m_owner);
        return false;
    }

    m_owner = writer;
    return true;
}

void DragOffsetState::release(OffsetWriter writer) noexcept
{
    if (m_owner == writer)
        m_owner = OffsetWriter::None;
}

bool DragOffsetState::write(OffsetWriter writer, double value)
{
    if (writer == OffsetWriter::None || writer != m_owner) {
        qCWarning(sheetlog) << "offset write by" << toString(writer)
                            << "rejected; owner is" << toString(m_owner);
        return false;
    }

    if (!std::isfinite(value)) {
        qCWarning(sheetlog) << "non-finite offset write rejected";
        return false;
    }

    if (m_notifying) {
        qCWarning(sheetlog) << "re-entrant offset write from a height subscriber rejected";
        return false;
    }

    m_value = value;

    if (m_observer)
        runAsNotification([this] { m_observer(m_value); });
    return true;
}

void DragOffsetState::runAsNotification(const std::function<void()>& fn)
{
    const bool outer = m_notifying;
    m_notifying = true;
    const auto reset = qScopeGuard([this, outer] { m_notifying = outer; });
    fn();
}

void DragOffsetState::setObserver(Observer observer)
{
    m_observer = std::move(observer);
}

} // namespace Sheet
