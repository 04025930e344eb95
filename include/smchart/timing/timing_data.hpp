#pragma once
#include <type_traits>
#include <utility>
#include <variant>
#include "smchart/common/common.hpp"
#include "smchart/note/note_info.hpp"
#include "smchart/chart_data.hpp"
#include "smchart/util/timing_utils.hpp"

namespace smchart
{
	template <typename Payload>
	struct TimedNote
	{
		std::int64_t ms = 0;
		NoteType type = NoteType::Tap;
		Payload payload{};

		bool operator==(const TimedNote&) const = default;
	};

	// Per-column note sequences, each in ascending time
	template <typename Payload>
	struct TimingData
	{
		ByColumn<std::vector<TimedNote<Payload>>> columns;

		[[nodiscard]]
		std::size_t size() const
		{
			std::size_t count = 0;
			for (const auto& column : columns)
			{
				count += column.size();
			}
			return count;
		}

		[[nodiscard]]
		bool empty() const
		{
			return size() == 0;
		}

		bool operator==(const TimingData&) const = default;
	};

	using PlainTimingData = TimingData<std::monostate>;

	template <typename SpriteFinder>
	using SpritePayloadType = std::decay_t<std::invoke_result_t<SpriteFinder&, std::int64_t, double, const Position&, NoteType, std::size_t>>;

	// Converts a note chart into per-column timed notes
	//
	// spriteFinder is called once per note with
	//   (std::int64_t measureIdx, double reserved (always 0.0), const Position& pos, NoteType type, std::size_t column)
	// and its result is stored in TimedNote::payload.
	//
	// Returns empty data if segments is empty or rate <= 0.
	// Notes whose column is kNumColumns or larger are dropped.
	// Rows whose time does not fit in std::int64_t (e.g. extremely slow tempo or rate) are dropped.
	template <typename SpriteFinder>
	[[nodiscard]]
	auto CreateTimingData(const NoteInfo& noteInfo, const std::vector<TempoSegment>& segments, double rate, SpriteFinder&& spriteFinder)
		-> TimingData<SpritePayloadType<SpriteFinder>>
	{
		TimingData<SpritePayloadType<SpriteFinder>> timingData;
		if (segments.empty() || !(rate > 0.0))
		{
			return timingData;
		}

		TempoSegmentCursor cursor(segments);
		for (std::size_t measureIdxSZ = 0; measureIdxSZ < noteInfo.measures.size(); ++measureIdxSZ)
		{
			const auto measureIdx = static_cast<std::int64_t>(measureIdxSZ);
			for (const auto& [pos, row] : noteInfo.measures[measureIdxSZ])
			{
				cursor.advanceTo(measureIdx, pos);

				const double rowMs = SegmentPositionToMs(cursor.current(), measureIdx, pos) / rate;
				if (!IsRepresentableMs(rowMs))
				{
					continue;
				}

				for (const NoteEntry& note : row)
				{
					if (note.column >= kNumColumnsSZ)
					{
						continue;
					}

					timingData.columns[note.column].push_back({
						.ms = static_cast<std::int64_t>(rowMs),
						.type = note.type,
						.payload = spriteFinder(measureIdx, 0.0, pos, note.type, note.column),
					});
				}
			}
		}

		return timingData;
	}

	[[nodiscard]]
	PlainTimingData CreateTimingData(const NoteInfo& noteInfo, const std::vector<TempoSegment>& segments, double rate);

	// One TimingData per note chart of the file
	template <typename SpriteFinder>
	[[nodiscard]]
	auto CreateTimingDataList(const ChartData& chartData, double rate, SpriteFinder&& spriteFinder)
		-> std::vector<TimingData<SpritePayloadType<SpriteFinder>>>
	{
		const std::vector<TempoSegment> segments = ResolveTempoSegments(chartData);

		std::vector<TimingData<SpritePayloadType<SpriteFinder>>> timingDataList;
		timingDataList.reserve(chartData.notes.size());
		for (const NoteInfo& noteInfo : chartData.notes)
		{
			timingDataList.push_back(CreateTimingData(noteInfo, segments, rate, spriteFinder));
		}
		return timingDataList;
	}

	[[nodiscard]]
	std::vector<PlainTimingData> CreateTimingDataList(const ChartData& chartData, double rate);
}
