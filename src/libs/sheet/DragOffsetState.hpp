// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sheet/SheetGlobal.hpp"

#include <functional>

namespace Sheet {

enum class OffsetWriter : unsigned char {
    None,
    Gesture,
    Animation
};

SHEET_EXPORT const char* toString(OffsetWriter writer) noexcept;

// The single drag offset of one sheet. Exactly one writer may hold it at a
// time; writes from anybody else are rejected. Every accepted write is
// reported synchronously to the observer.
class SHEET_EXPORT DragOffsetState final
{
public:
    using Observer = std::function<void(double offset)>;

    explicit DragOffsetState(double initial = 0.0) noexcept;

    DragOffsetState(const DragOffsetState&) = delete;
    DragOffsetState& operator=(const DragOffsetState&) = delete;

    double value() const noexcept { return m_value; }
    OffsetWriter owner() const noexcept { return m_owner; }
    bool isNotifying() const noexcept { return m_notifying; }

    bool acquire(OffsetWriter writer);
    void release(OffsetWriter writer) noexcept;

    // Returns false when `writer` does not own the offset, when `value` is not
    // finite, or when called from inside the observer.
    bool write(OffsetWriter writer, double value);

    void setObserver(Observer observer);

    // Runs `fn` under the same guard as an observer notification, so writes
    // issued from inside it are rejected.
    void runAsNotification(const std::function<void()>& fn);

private:
    double m_value = 0.0;
    OffsetWriter m_owner = OffsetWriter::None;
    bool m_notifying = false;
    Observer m_observer;
};

} // namespace Sheet
