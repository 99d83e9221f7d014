#pragma once

#include "env/moveDelta.hpp"

namespace hex::env {

class IMoveListener {
public:
	virtual ~IMoveListener()                           = default;
	virtual void onMoveApplied(const MoveDelta& delta) = 0;
};

} // namespace hex::env
