#pragma once

#include "env/IMoveListener.hpp"

#include <vector>

namespace hex::env {

//! Allows external components to be updated on applied moves.
//! \note Signals are synchronous and run on the caller thread.
class EventHub {
public:
	void subscribe(IMoveListener* listener);
	void unsubscribe(IMoveListener* listener);

	void signal(const MoveDelta& delta); //!< Forward a move delta to every listener.

private:
	std::vector<IMoveListener*> m_listeners;
};

} // namespace hex::env
