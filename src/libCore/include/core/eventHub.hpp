#pragma once

#include "core/IGameSignalListener.hpp"
#include "core/IGameStateListener.hpp"

#include <mutex>
#include <vector>

namespace notakto {

//! Allows external components (rendering, sound, rewards) to be updated on match events.
//! \note Signals are synchronous and run on the caller thread.
class EventHub {
	struct SignalListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

	void signal(GameSignal signal);           //!< Signal a match event.
	void signalDelta(const GameDelta& delta); //!< Signal a match state delta.

private:
	std::mutex m_listenerMutex;
	std::vector<SignalListenerEntry> m_signalListeners;
	std::vector<IGameStateListener*> m_stateListeners;
};

} // namespace notakto
