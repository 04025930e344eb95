#include "smchart/timing/timing_data.hpp"

namespace
{
	using namespace smchart;

	std::monostate NoSprite(std::int64_t, double, const Position&, NoteType, std::size_t)
	{
		return std::monostate{};
	}
}

smchart::PlainTimingData smchart::CreateTimingData(const NoteInfo& noteInfo, const std::vector<TempoSegment>& segments, double rate)
{
	return CreateTimingData(noteInfo, segments, rate, NoSprite);
}

std::vector<smchart::PlainTimingData> smchart::CreateTimingDataList(const ChartData& chartData, double rate)
{
	return CreateTimingDataList(chartData, rate, NoSprite);
}
