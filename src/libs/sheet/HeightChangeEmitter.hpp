// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sheet/SheetConfig.hpp"
#include "sheet/SheetGlobal.hpp"

#include <QtCore/QtGlobal>

#include <functional>
#include <memory>
#include <vector>

namespace Sheet {

class DragOffsetState;

// Publishes the sheet height derived from a DragOffsetState.
//
// A new subscriber receives the current height immediately. After that every
// offset write that changes the height is delivered synchronously, in
// subscription order, before the write returns. Subscribers must not write the
// offset from inside their callback; such writes are rejected.
class SHEET_EXPORT HeightChangeEmitter final
{
    struct Registry;

public:
    using Callback = std::function<void(double height)>;

    // Scoped registration. Once released (explicitly or by destruction) the
    // callback is never invoked again, even if the release happens while a
    // delivery is in progress. Safe to release after the emitter is gone.
    class SHEET_EXPORT Subscription final
    {
    public:
        Subscription() = default;
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        bool isActive() const;
        void release();

    private:
        friend class HeightChangeEmitter;
        Subscription(std::weak_ptr<Registry> registry, quint64 id);

        std::weak_ptr<Registry> m_registry;
        quint64 m_id = 0;
    };

    HeightChangeEmitter(DragOffsetState& state, const SheetConfig& config);
    ~HeightChangeEmitter();

    HeightChangeEmitter(const HeightChangeEmitter&) = delete;
    HeightChangeEmitter& operator=(const HeightChangeEmitter&) = delete;

    [[nodiscard]] Subscription subscribe(Callback callback);

    double currentHeight() const noexcept { return m_height; }
    int subscriberCount() const;

private:
    struct Entry final {
        quint64 id = 0;
        Callback callback;
        bool active = true;
    };

    struct Registry final {
        quint64 nextId = 1;
        std::vector<std::shared_ptr<Entry>> entries;

        void remove(quint64 id);
    };

    void onOffsetWritten(double offset);

    DragOffsetState& m_state;
    SheetConfig m_config;
    double m_height = 0.0;
    std::shared_ptr<Registry> m_registry;
};

} // namespace Sheet
