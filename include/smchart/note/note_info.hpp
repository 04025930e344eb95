#pragma once
#include "smchart/common/common.hpp"

namespace smchart
{
	enum class NoteType : std::uint8_t
	{
		Tap,
		Hold,
		HoldEnd,
		Roll,
		Mine,
		Lift,
		Fake,
	};

	struct NoteEntry
	{
		NoteType type = NoteType::Tap;
		std::size_t column = 0;
	};

	// Notes sharing one position (unordered)
	using NoteRow = std::vector<NoteEntry>;

	using Measure = ByPosition<NoteRow>;

	// Header fields of a "#NOTES" block (informational only)
	struct NotesHeader
	{
		std::string stepsType;
		std::string description;
		std::string difficulty;
		std::string meter;
		std::string radarValues;
	};

	struct NoteInfo
	{
		NotesHeader header;

		// Measure index = vector index
		std::vector<Measure> measures;
	};

	// Returns std::nullopt for '0' and for unknown characters
	[[nodiscard]]
	std::optional<NoteType> CharToNoteType(char c);

	[[nodiscard]]
	const char* NoteTypeToString(NoteType type);

	[[nodiscard]]
	std::optional<NoteType> StringToNoteType(std::string_view str);

	[[nodiscard]]
	std::size_t CountNotes(const NoteInfo& noteInfo);
}
