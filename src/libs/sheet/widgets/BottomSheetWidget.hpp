// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sheet/HeightChangeEmitter.hpp"
#include "sheet/SheetConfig.hpp"
#include "sheet/SheetGlobal.hpp"

#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

class QScrollArea;
class QVBoxLayout;

namespace Sheet {

class SheetController;
class SheetHandleWidget;

// Overlay pinned to the bottom edge of its parent. Its height follows the
// gesture engine; header and content are supplied by the caller and are
// optional.
class SHEET_EXPORT BottomSheetWidget final : public QWidget
{
    Q_OBJECT

public:
    // Throws ConfigError when `config` does not validate.
    explicit BottomSheetWidget(const SheetConfig& config, QWidget* parent = nullptr);
    ~BottomSheetWidget() override;

    SheetController* controller() const noexcept { return m_controller; }
    SheetHandleWidget* handle() const noexcept { return m_handle; }

    // Takes ownership. Passing nullptr removes the current widget.
    void setHeader(QWidget* header);
    void setContent(QWidget* content);
    QWidget* header() const noexcept { return m_header; }
    QWidget* content() const;

    double sheetHeight() const noexcept { return m_sheetHeight; }

signals:
    void heightChanged(double height);
    void closeRequested();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;
    void showEvent(QShowEvent* e) override;

private:
    static constexpr int kFadeInMs = 200;

    void applyHeight(double height);
    void reanchor();
    void fadeIn();

    SheetController* m_controller = nullptr;
    SheetHandleWidget* m_handle = nullptr;
    QVBoxLayout* m_headerSlot = nullptr;
    QScrollArea* m_scroll = nullptr;
    QPointer<QWidget> m_header;
    QPointer<QWidget> m_observedParent;

    HeightChangeEmitter::Subscription m_heightSubscription;
    double m_sheetHeight = 0.0;
    bool m_fadedIn = false;
};

} // namespace Sheet
