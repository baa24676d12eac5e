// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sheet/SheetGlobal.hpp"

#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

class QMouseEvent;

namespace Sheet {

class SheetController;

// The visible grab affordance at the top of a sheet. Presses here are the
// only way to start a drag gesture.
class SHEET_EXPORT SheetHandleWidget final : public QWidget
{
    Q_OBJECT

public:
    explicit SheetHandleWidget(SheetController* controller, QWidget* parent = nullptr);

    bool isDragging() const noexcept { return m_dragging; }

    QSize sizeHint() const override;

protected:
    void mousePressEvent(QMouseEvent* e) override;
    void mouseMoveEvent(QMouseEvent* e) override;
    void mouseReleaseEvent(QMouseEvent* e) override;
    void hideEvent(QHideEvent* e) override;
    void paintEvent(QPaintEvent* e) override;

private:
    void endDrag(bool cancelled);

    static constexpr int kHandleAreaPx = 24;
    static constexpr int kPillWidthPx = 40;
    static constexpr int kPillHeightPx = 5;

    QPointer<SheetController> m_controller; // non-owning
    bool m_dragging = false;
};

} // namespace Sheet
