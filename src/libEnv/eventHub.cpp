#include "env/eventHub.hpp"

#include <algorithm>

namespace hex::env {

void EventHub::subscribe(IMoveListener* listener) {
	m_listeners.push_back(listener);
}

void EventHub::unsubscribe(IMoveListener* listener) {
	m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener), m_listeners.end());
}

void EventHub::signal(const MoveDelta& delta) {
	for (auto* listener: m_listeners) {
		listener->onMoveApplied(delta);
	}
}

} // namespace hex::env
