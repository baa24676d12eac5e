// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/widgets/SheetHandleWidget.hpp"

#include "sheet/SheetController.hpp"

#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>

namespace Sheet {

SheetHandleWidget::SheetHandleWidget(SheetController* controller, QWidget* parent)
    : QWidget(parent)
    , m_controller(controller)
{
    setObjectName("SheetHandle");
    setFixedHeight(kHandleAreaPx);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
    setCursor(Qt::OpenHandCursor);
    setAttribute(Qt::WA_StyledBackground, false);

    if (m_controller) {
        // The cancel key may snap the sheet away mid-drag; drop the grab then.
        connect(m_controller, &SheetController::stateChanged, this, [this](SheetController::State state) {
            if (m_dragging && state != SheetController::State::Dragging) {
                m_dragging = false;
                setCursor(Qt::OpenHandCursor);
                releaseMouse();
            }
        });
    }
}

QSize SheetHandleWidget::sizeHint() const
{
    return {kPillWidthPx * 2, kHandleAreaPx};
}

void SheetHandleWidget::mousePressEvent(QMouseEvent* e)
{
    if (e->button() != Qt::LeftButton || !m_controller) {
        QWidget::mousePressEvent(e);
        return;
    }

    // Global coordinates: this widget moves with the sheet's top edge while
    // the sheet resizes, local coordinates would chase themselves.
    if (!m_controller->pointerDown(e->globalPosition().y(), true)) {
        QWidget::mousePressEvent(e);
        return;
    }

    m_dragging = true;
    setCursor(Qt::ClosedHandCursor);
    grabMouse();
    e->accept();
}

void SheetHandleWidget::mouseMoveEvent(QMouseEvent* e)
{
    if (!m_dragging || !m_controller) {
        QWidget::mouseMoveEvent(e);
        return;
    }

    m_controller->pointerMove(e->globalPosition().y());
    e->accept();
}

void SheetHandleWidget::mouseReleaseEvent(QMouseEvent* e)
{
    if (m_dragging && e->button() == Qt::LeftButton) {
        endDrag(false);
        e->accept();
        return;
    }
    QWidget::mouseReleaseEvent(e);
}

void SheetHandleWidget::hideEvent(QHideEvent* e)
{
    if (m_dragging)
        endDrag(true);
    QWidget::hideEvent(e);
}

void SheetHandleWidget::paintEvent(QPaintEvent* e)
{
    Q_UNUSED(e);

    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing, true);
    p.setPen(Qt::NoPen);
    p.setBrush(palette().color(QPalette::Mid));

    const QRectF pill((width() - kPillWidthPx) / 2.0,
                      (height() - kPillHeightPx) / 2.0,
                      kPillWidthPx,
                      kPillHeightPx);
    p.drawRoundedRect(pill, kPillHeightPx / 2.0, kPillHeightPx / 2.0);
}

void SheetHandleWidget::endDrag(bool cancelled)
{
    m_dragging = false;
    setCursor(Qt::OpenHandCursor);
    releaseMouse();

    if (!m_controller)
        return;

    if (cancelled)
        m_controller->pointerCancel();
    else
        m_controller->pointerUp();
}

} // namespace Sheet
