#pragma once
#include "smchart/common/common.hpp"
#include "smchart/meta/meta_info.hpp"
#include "smchart/beat/beat_info.hpp"
#include "smchart/note/note_info.hpp"
#include "smchart/error.hpp"

namespace smchart
{
	struct MetaChartData
	{
		MetaInfo meta;
		BeatInfo beat;

		std::vector<std::string> warnings;

		ErrorType error = ErrorType::None;
	};

	struct ChartData
	{
		MetaInfo meta;
		BeatInfo beat;

		// One entry per "#NOTES" field, in file order
		std::vector<NoteInfo> notes;

		std::vector<std::string> warnings;

		ErrorType error = ErrorType::None;
	};
}
