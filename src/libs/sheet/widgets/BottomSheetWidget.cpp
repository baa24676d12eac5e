// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/widgets/BottomSheetWidget.hpp"

#include "sheet/SheetController.hpp"
#include "sheet/widgets/SheetHandleWidget.hpp"

#include <QtCore/QEvent>
#include <QtCore/QPropertyAnimation>
#include <QtWidgets/QFrame>
#include <QtWidgets/QGraphicsOpacityEffect>
#include <QtWidgets/QScrollArea>
#include <QtWidgets/QVBoxLayout>

namespace Sheet {

BottomSheetWidget::BottomSheetWidget(const SheetConfig& config, QWidget* parent)
    : QWidget(parent)
{
    setObjectName("BottomSheet");
    setAttribute(Qt::WA_StyledBackground, true);
    setAutoFillBackground(true);

    m_controller = new SheetController(config, this);

    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(0, 0, 0, 0);
    root->setSpacing(0);

    m_handle = new SheetHandleWidget(m_controller, this);
    root->addWidget(m_handle, 0);

    auto* body = new QVBoxLayout();
    body->setContentsMargins(16, 0, 16, 0);
    body->setSpacing(0);

    m_headerSlot = new QVBoxLayout();
    m_headerSlot->setContentsMargins(0, 0, 0, 0);
    m_headerSlot->setSpacing(0);
    body->addLayout(m_headerSlot, 0);

    m_scroll = new QScrollArea(this);
    m_scroll->setObjectName("BottomSheetContent");
    m_scroll->setFrameShape(QFrame::NoFrame);
    m_scroll->setWidgetResizable(true);
    m_scroll->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    m_scroll->setMinimumHeight(0);
    body->addWidget(m_scroll, 1);

    root->addLayout(body, 1);

    connect(m_controller, &SheetController::closeRequested, this, &BottomSheetWidget::closeRequested);

    if (parent) {
        m_observedParent = parent;
        parent->installEventFilter(this);
    }

    m_heightSubscription = m_controller->subscribe([this](double h) { applyHeight(h); });
}

BottomSheetWidget::~BottomSheetWidget()
{
    m_heightSubscription.release();
    if (m_observedParent)
        m_observedParent->removeEventFilter(this);
}

void BottomSheetWidget::setHeader(QWidget* header)
{
    if (m_header == header)
        return;

    if (m_header) {
        m_headerSlot->removeWidget(m_header);
        m_header->deleteLater();
    }

    m_header = header;
    if (m_header)
        m_headerSlot->addWidget(m_header);
}

void BottomSheetWidget::setContent(QWidget* content)
{
    if (QWidget* old = m_scroll->takeWidget())
        old->deleteLater();

    if (content)
        m_scroll->setWidget(content);
}

QWidget* BottomSheetWidget::content() const
{
    return m_scroll->widget();
}

bool BottomSheetWidget::eventFilter(QObject* watched, QEvent* event)
{
    if (watched == m_observedParent && event->type() == QEvent::Resize)
        reanchor();
    return QWidget::eventFilter(watched, event);
}

void BottomSheetWidget::showEvent(QShowEvent* e)
{
    QWidget::showEvent(e);
    reanchor();
    if (!m_fadedIn) {
        m_fadedIn = true;
        fadeIn();
    }
}

void BottomSheetWidget::applyHeight(double height)
{
    m_sheetHeight = height;
    setFixedHeight(qRound(height));
    reanchor();
    emit heightChanged(height);
}

void BottomSheetWidget::reanchor()
{
    QWidget* host = parentWidget();
    if (!host)
        return;

    const int h = qRound(m_sheetHeight);
    setGeometry(0, host->height() - h, host->width(), h);
}

void BottomSheetWidget::fadeIn()
{
    auto* effect = new QGraphicsOpacityEffect(this);
    effect->setOpacity(0.0);
    setGraphicsEffect(effect);

    auto* anim = new QPropertyAnimation(effect, "opacity", this);
    anim->setObjectName("BottomSheetFadeIn");
    anim->setDuration(kFadeInMs);
    anim->setStartValue(0.0);
    anim->setEndValue(1.0);
    connect(anim, &QPropertyAnimation::finished, this, [this]() {
        setGraphicsEffect(nullptr);
    });
    anim->start(QAbstractAnimation::DeleteWhenStopped);
}

} // namespace Sheet
