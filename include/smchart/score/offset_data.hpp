#pragma once
#include "smchart/common/common.hpp"
#include "smchart/note/note_info.hpp"

namespace smchart
{
	struct OffsetRecord
	{
		std::optional<std::int64_t> offsetMs; // std::nullopt if the note was never hit
		NoteType type = NoteType::Tap;

		bool operator==(const OffsetRecord&) const = default;
	};

	// Judged notes per column, in judgment order
	struct OffsetData
	{
		ByColumn<std::vector<OffsetRecord>> columns;

		// Records with column >= kNumColumns are ignored (returns false)
		bool add(const OffsetRecord& record, std::size_t column)
		{
			if (column >= kNumColumnsSZ)
			{
				return false;
			}
			columns[column].push_back(record);
			return true;
		}

		bool operator==(const OffsetData&) const = default;
	};
}
