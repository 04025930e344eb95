#pragma once
#include "smchart/common/common.hpp"

namespace smchart
{
	struct TempoChange
	{
		double measureValue = 0.0; // measure index + position within measure
		double bpm = 120.0;
	};

	struct BeatInfo
	{
		// Sorted by measureValue (ascending)
		std::vector<TempoChange> bpm;
	};
}
