#pragma once
#ifndef SMCHART_WITHOUT_JSON_DEPENDENCY
#include <istream>
#include <ostream>
#include "smchart/chart_data.hpp"
#include "smchart/timing/timing_data.hpp"
#include "smchart/score/offset_data.hpp"

namespace smchart
{
	inline constexpr const char* kTimingJSONFormatVersion = "1.0.0";

	struct OffsetJSONData
	{
		OffsetData offsets;

		std::vector<std::string> warnings;

		ErrorType error = ErrorType::None;
	};

	// timingDataList must have one entry per chartData.notes entry
	ErrorType SaveTimingJSON(std::ostream& stream, const ChartData& chartData, const std::vector<PlainTimingData>& timingDataList);

	ErrorType SaveTimingJSON(const std::string& filePath, const ChartData& chartData, const std::vector<PlainTimingData>& timingDataList);

	OffsetJSONData LoadOffsetJSON(std::istream& stream);

	OffsetJSONData LoadOffsetJSON(const std::string& filePath);

	ErrorType SaveOffsetJSON(std::ostream& stream, const OffsetData& offsetData);

	ErrorType SaveOffsetJSON(const std::string& filePath, const OffsetData& offsetData);
}
#endif
