// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/HeightChangeEmitter.hpp"

#include "sheet/DragOffsetState.hpp"
#include "sheet/HeightTransform.hpp"

#include <algorithm>
#include <utility>

namespace Sheet {

void HeightChangeEmitter::Registry::remove(quint64 id)
{
    auto it = std::find_if(entries.begin(), entries.end(),
                           [id](const std::shared_ptr<Entry>& e) { return e->id == id; });
    if (it == entries.end())
        return;

    (*it)->active = false;
    entries.erase(it);
}

HeightChangeEmitter::Subscription::Subscription(std::weak_ptr<Registry> registry, quint64 id)
    : m_registry(std::move(registry))
    , m_id(id)
{
}

HeightChangeEmitter::Subscription::~Subscription()
{
    release();
}

HeightChangeEmitter::Subscription::Subscription(Subscription&& other) noexcept
    : m_registry(std::move(other.m_registry))
    , m_id(std::exchange(other.m_id, 0))
{
}

HeightChangeEmitter::Subscription&
HeightChangeEmitter::Subscription::operator=(Subscription&& other) noexcept
{
    if (this != &other) {
        release();
        m_registry = std::move(other.m_registry);
        m_id = std::exchange(other.m_id, 0);
    }
    return *this;
}

bool HeightChangeEmitter::Subscription::isActive() const
{
    const auto registry = m_registry.lock();
    if (!registry || m_id == 0)
        return false;

    return std::any_of(registry->entries.begin(), registry->entries.end(),
                       [this](const std::shared_ptr<Entry>& e) { return e->id == m_id; });
}

void HeightChangeEmitter::Subscription::release()
{
    if (auto registry = m_registry.lock())
        registry->remove(m_id);

    m_registry.reset();
    m_id = 0;
}

HeightChangeEmitter::HeightChangeEmitter(DragOffsetState& state, const SheetConfig& config)
    : m_state(state)
    , m_config(config)
    , m_height(HeightTransform::heightForOffset(state.value(), config))
    , m_registry(std::make_shared<Registry>())
{
    m_state.setObserver([this](double offset) { onOffsetWritten(offset); });
}

HeightChangeEmitter::~HeightChangeEmitter()
{
    m_state.setObserver({});
    for (const auto& entry : m_registry->entries)
        entry->active = false;
}

HeightChangeEmitter::Subscription HeightChangeEmitter::subscribe(Callback callback)
{
    if (!callback)
        return {};

    auto entry = std::make_shared<Entry>();
    entry->id = m_registry->nextId++;
    entry->callback = std::move(callback);
    m_registry->entries.push_back(entry);

    Subscription subscription(m_registry, entry->id);

    m_state.runAsNotification([&entry, this] { entry->callback(m_height); });

    return subscription;
}

int HeightChangeEmitter::subscriberCount() const
{
    return int(m_registry->entries.size());
}

void HeightChangeEmitter::onOffsetWritten(double offset)
{
    const double height = HeightTransform::heightForOffset(offset, m_config);
    if (height == m_height)
        return;

    m_height = height;

    // Iterate a snapshot: callbacks may subscribe or release while we deliver.
    const auto snapshot = m_registry->entries;
    for (const auto& entry : snapshot) {
        if (entry->active)
            entry->callback(height);
    }
}

} // namespace Sheet
