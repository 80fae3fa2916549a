#include "animation-types.hpp"

const char *AnimationErrorName(AnimationError error)
{
	switch (error) {
	case AnimationError::None:
		return "None";
	case AnimationError::NotFound:
		return "NotFound";
	case AnimationError::EmptyCollection:
		return "EmptyCollection";
	case AnimationError::LastItemProtected:
		return "LastItemProtected";
	case AnimationError::InvalidOrder:
		return "InvalidOrder";
	case AnimationError::ConfigIOError:
		return "ConfigIOError";
	case AnimationError::CopyFailed:
		return "CopyFailed";
	}
	return "Unknown";
}
