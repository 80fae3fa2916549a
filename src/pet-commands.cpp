#include "pet-commands.hpp"
#include "pet-logging.hpp"

#include <utility>

const char *PetCommandName(PetCommand command)
{
	switch (command) {
	case PetCommand::SwitchAnimation:
		return "SwitchAnimation";
	case PetCommand::ImportAnimation:
		return "ImportAnimation";
	case PetCommand::DeleteCurrent:
		return "DeleteCurrent";
	case PetCommand::CustomizeOrder:
		return "CustomizeOrder";
	case PetCommand::ToggleAutoSwitch:
		return "ToggleAutoSwitch";
	case PetCommand::SetAutoSwitchInterval:
		return "SetAutoSwitchInterval";
	case PetCommand::ResizePet:
		return "ResizePet";
	case PetCommand::Quit:
		return "Quit";
	}
	return "Unknown";
}

void CommandTable::Register(PetCommand command, Handler handler)
{
	handlers[command] = std::move(handler);
}

bool CommandTable::Contains(PetCommand command) const
{
	auto it = handlers.find(command);
	return it != handlers.end() && it->second;
}

bool CommandTable::Dispatch(PetCommand command, const QVariant &argument) const
{
	auto it = handlers.find(command);
	if (it == handlers.end() || !it->second) {
		qCWarning(lcUi, "No handler registered for %s", PetCommandName(command));
		return false;
	}

	qCDebug(lcUi, "Dispatching %s", PetCommandName(command));
	it->second(argument);
	return true;
}
