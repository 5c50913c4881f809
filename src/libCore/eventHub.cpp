#include "core/eventHub.hpp"

namespace notakto {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	std::erase_if(m_signalListeners, [&](const SignalListenerEntry& e) { return e.listener == listener; });
}

void EventHub::subscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_stateListeners.push_back(listener);
}

void EventHub::unsubscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	std::erase(m_stateListeners, listener);
}

void EventHub::signal(GameSignal signal) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	for (const auto& [listener, signalMask]: m_signalListeners) {
		if (signalMask & signal) {
			listener->onGameEvent(signal);
		}
	}
}

void EventHub::signalDelta(const GameDelta& delta) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	for (auto* listener: m_stateListeners) {
		listener->onGameDelta(delta);
	}
}

} // namespace notakto
