#pragma once
#include "smchart/common/common.hpp"

namespace smchart
{
	struct MetaInfo
	{
		std::optional<std::string> title;

		// Seconds to shift notes earlier (negated "#OFFSET" value)
		std::optional<double> offset;

		// Tempo of the last "#BPMS" entry, for display only (timing uses BeatInfo)
		std::optional<double> dispBPM;
	};
}
