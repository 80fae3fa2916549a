#pragma once

#include <QVariant>

#include <functional>
#include <map>

// Context menu actions. The QVariant argument each one takes is noted.
enum class PetCommand {
	SwitchAnimation,       // QString path
	ImportAnimation,
	DeleteCurrent,
	CustomizeOrder,
	ToggleAutoSwitch,      // bool enabled
	SetAutoSwitchInterval, // int seconds
	ResizePet,             // int pixels
	Quit,
};

const char *PetCommandName(PetCommand command);

class CommandTable {
public:
	using Handler = std::function<void(const QVariant &argument)>;

	void Register(PetCommand command, Handler handler);
	bool Contains(PetCommand command) const;

	// Returns false if no handler is registered for command
	bool Dispatch(PetCommand command, const QVariant &argument = QVariant()) const;

private:
	std::map<PetCommand, Handler> handlers;
};
