#pragma once

#include <QString>

enum class AnimationOrigin {
	BuiltIn,
	User,
};

struct AnimationEntry {
	QString path; // absolute, '/' separated
	AnimationOrigin origin = AnimationOrigin::BuiltIn;
};

enum class AnimationError {
	None,
	NotFound,          // source or target file missing
	EmptyCollection,   // no animation in either root
	LastItemProtected, // delete would leave nothing to show
	InvalidOrder,      // reorder input is not a permutation of the list
	ConfigIOError,     // order config could not be read or written
	CopyFailed,        // import copy into the user root failed
};

const char *AnimationErrorName(AnimationError error);
