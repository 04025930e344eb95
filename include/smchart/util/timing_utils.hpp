#pragma once
#include "smchart/common/common.hpp"
#include "smchart/beat/beat_info.hpp"
#include "smchart/chart_data.hpp"

namespace smchart
{
	struct MeasurePosition
	{
		std::int64_t measureIdx = 0;
		Position fraction; // 0 <= fraction < 1
	};

	struct TempoSegment
	{
		std::int64_t measureIdx = 0;
		Position fraction; // 0 <= fraction < 1
		double bpm = 120.0;
		double startMs = 0.0;
	};

	// Splits a floating-point measure value into a measure index and an exact fraction
	// The fraction is the closest rational with a denominator of at most kMaxMeasureValueDenominator,
	// so values finer than a 192nd of a measure are rounded
	// Values beyond kMaxAbsMeasureValue are clamped (NaN is treated as 0)
	[[nodiscard]]
	MeasurePosition SplitMeasureValue(double measureValue);

	// Finite and within kMaxAbsMeasureValue
	[[nodiscard]]
	bool IsValidMeasureValue(double measureValue);

	// Finite and positive
	[[nodiscard]]
	bool IsValidTempo(double bpm);

	// True if ms can be truncated to std::int64_t
	[[nodiscard]]
	bool IsRepresentableMs(double ms);

	// Builds one segment per tempo change (same order), integrating elapsed time at the previous tempo
	// Returns an empty vector if there are no tempo changes or any of them is invalid
	// (see IsValidMeasureValue() and IsValidTempo())
	[[nodiscard]]
	std::vector<TempoSegment> ResolveTempoSegments(const BeatInfo& beatInfo, double offsetMs);

	// Uses the chart offset (seconds, absent means zero)
	[[nodiscard]]
	std::vector<TempoSegment> ResolveTempoSegments(const ChartData& chartData);

	// True if the position (measureIdx, pos) is at or after the start of the segment
	[[nodiscard]]
	bool IsSegmentReached(const TempoSegment& segment, std::int64_t measureIdx, const Position& pos);

	// Elapsed measures from the segment start to (measureIdx, pos), exact
	[[nodiscard]]
	Position MeasureDelta(const TempoSegment& segment, std::int64_t measureIdx, const Position& pos);

	// Absolute time of (measureIdx, pos) inside the given segment, at rate 1.0
	[[nodiscard]]
	double SegmentPositionToMs(const TempoSegment& segment, std::int64_t measureIdx, const Position& pos);

	// Random-access lookup (binary search); positions before the first segment extrapolate its tempo
	// Returns 0.0 if segments is empty
	[[nodiscard]]
	double MeasurePositionToMs(std::int64_t measureIdx, const Position& pos, const std::vector<TempoSegment>& segments);

	// Returns 0.0 if segments is empty
	[[nodiscard]]
	double TempoAt(std::int64_t measureIdx, const Position& pos, const std::vector<TempoSegment>& segments);

	// Forward-only cursor over resolved tempo segments
	// Holds the active segment (i) and the lookahead segment (i + 1)
	class TempoSegmentCursor
	{
	private:
		const std::vector<TempoSegment>* m_pSegments;
		std::size_t m_currentIdx = 0;

	public:
		// segments must not be empty and must outlive the cursor
		explicit TempoSegmentCursor(const std::vector<TempoSegment>& segments);

		[[nodiscard]]
		const TempoSegment& current() const;

		// nullptr if the current segment is the last one
		[[nodiscard]]
		const TempoSegment* next() const;

		[[nodiscard]]
		std::size_t currentIdx() const
		{
			return m_currentIdx;
		}

		// Promotes the lookahead segment while it is reached by (measureIdx, pos)
		// Positions must be passed in non-decreasing order
		// Returns true if the current segment changed
		bool advanceTo(std::int64_t measureIdx, const Position& pos);
	};
}
