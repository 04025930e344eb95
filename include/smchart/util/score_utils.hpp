#pragma once
#include "smchart/common/common.hpp"
#include "smchart/note/note_info.hpp"
#include "smchart/score/offset_data.hpp"

namespace smchart
{
	constexpr double kWifeMaxPoints = 2.0;
	constexpr double kWifeMissPoints = -8.0;

	// Average deviation (ms) of the wife curve at timing scale 1.0
	constexpr double kWifeAveDeviationMs = 95.0;

	// Points for one judged note
	//   Tap/Hold/Roll/Lift: 2.0 at offset 0, decreasing toward -8.0 as |offset| grows, -8.0 if never hit
	//   Mine: -8.0 if hit, otherwise 0.0
	//   Fake/HoldEnd: always 0.0
	// ts scales the tolerance window (ts > 0)
	[[nodiscard]]
	double WifePoints(const OffsetRecord& record, double ts = 1.0);

	[[nodiscard]]
	double MaxPoints(NoteType type);

	[[nodiscard]]
	bool IsScorable(NoteType type);

	// Running sums of wife points and max points
	class ScoreAccumulator
	{
	private:
		double m_ts = 1.0;
		double m_points = 0.0;
		double m_maxPoints = 0.0;
		std::size_t m_numRecords = 0;

	public:
		ScoreAccumulator() = default;

		explicit ScoreAccumulator(double ts)
			: m_ts(ts)
		{
		}

		void add(const OffsetRecord& record);

		[[nodiscard]]
		double points() const
		{
			return m_points;
		}

		[[nodiscard]]
		double maxPoints() const
		{
			return m_maxPoints;
		}

		[[nodiscard]]
		std::size_t numRecords() const
		{
			return m_numRecords;
		}

		// points() / maxPoints(); not meaningful while maxPoints() is zero
		[[nodiscard]]
		double ratio() const
		{
			return m_points / m_maxPoints;
		}
	};

	// Sum of wife points / sum of max points
	// The result is not meaningful if there are no scorable notes (check HasScorableNotes() first)
	[[nodiscard]]
	double CalculateScore(const OffsetData& offsetData, double ts = 1.0);

	[[nodiscard]]
	double CalculateScore(const std::vector<OffsetRecord>& records, double ts = 1.0);

	[[nodiscard]]
	bool HasScorableNotes(const OffsetData& offsetData);

	[[nodiscard]]
	bool HasScorableNotes(const std::vector<OffsetRecord>& records);
}
