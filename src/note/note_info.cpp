#include "smchart/note/note_info.hpp"

std::optional<smchart::NoteType> smchart::CharToNoteType(char c)
{
	switch (c)
	{
	case '1':
		return NoteType::Tap;
	case '2':
		return NoteType::Hold;
	case '3':
		return NoteType::HoldEnd;
	case '4':
		return NoteType::Roll;
	case 'M':
		return NoteType::Mine;
	case 'L':
		return NoteType::Lift;
	case 'F':
		return NoteType::Fake;
	default:
		return std::nullopt;
	}
}

const char* smchart::NoteTypeToString(NoteType type)
{
	switch (type)
	{
	case NoteType::Tap:
		return "tap";
	case NoteType::Hold:
		return "hold";
	case NoteType::HoldEnd:
		return "hold_end";
	case NoteType::Roll:
		return "roll";
	case NoteType::Mine:
		return "mine";
	case NoteType::Lift:
		return "lift";
	case NoteType::Fake:
		return "fake";
	}
	return "";
}

std::optional<smchart::NoteType> smchart::StringToNoteType(std::string_view str)
{
	constexpr std::array kNoteTypes = {
		NoteType::Tap,
		NoteType::Hold,
		NoteType::HoldEnd,
		NoteType::Roll,
		NoteType::Mine,
		NoteType::Lift,
		NoteType::Fake,
	};

	for (const NoteType type : kNoteTypes)
	{
		if (str == NoteTypeToString(type))
		{
			return type;
		}
	}
	return std::nullopt;
}

std::size_t smchart::CountNotes(const NoteInfo& noteInfo)
{
	std::size_t count = 0;
	for (const auto& measure : noteInfo.measures)
	{
		for (const auto& [pos, row] : measure)
		{
			count += row.size();
		}
	}
	return count;
}
