#include "smchart/util/timing_utils.hpp"
#include <stdexcept>

namespace
{
	using namespace smchart;

	// Closest rational to value (0 <= value < 1) with denominator <= maxDenominator,
	// using continued fraction convergents and the last semiconvergent
	Position ApproximateFraction(double value, std::int64_t maxDenominator)
	{
		constexpr int kMaxIterations = 64;
		constexpr double kRemainderEpsilon = 1e-12;

		std::int64_t prevNum = 1;
		std::int64_t prevDen = 0;
		std::int64_t num = 0;
		std::int64_t den = 1;

		double x = value;
		for (int i = 0; i < kMaxIterations; ++i)
		{
			const double a = std::floor(x);
			const auto ai = static_cast<std::int64_t>(a);

			// The first term (integer part) is always zero and matches the initial 0/1
			if (i > 0)
			{
				const std::int64_t nextDen = ai * den + prevDen;
				if (nextDen > maxDenominator)
				{
					const std::int64_t t = (maxDenominator - prevDen) / den;
					const Position convergent(num, den);
					if (t <= 0)
					{
						return convergent;
					}

					const Position semiconvergent(t * num + prevNum, t * den + prevDen);
					const double convergentError = std::abs(value - PositionToDouble(convergent));
					const double semiconvergentError = std::abs(value - PositionToDouble(semiconvergent));
					return semiconvergentError < convergentError ? semiconvergent : convergent;
				}

				const std::int64_t nextNum = ai * num + prevNum;
				prevNum = num;
				prevDen = den;
				num = nextNum;
				den = nextDen;
			}

			const double remainder = x - a;
			if (remainder < kRemainderEpsilon)
			{
				break;
			}
			x = 1.0 / remainder;
		}

		return Position(num, den);
	}

	// Last segment reached by the position (the first segment if none is reached)
	std::vector<TempoSegment>::const_iterator SegmentItrAt(const std::vector<TempoSegment>& segments, std::int64_t measureIdx, const Position& pos)
	{
		auto itr = std::partition_point(segments.begin(), segments.end(),
			[measureIdx, &pos](const TempoSegment& segment) { return IsSegmentReached(segment, measureIdx, pos); });
		if (itr != segments.begin())
		{
			--itr;
		}
		return itr;
	}
}

smchart::MeasurePosition smchart::SplitMeasureValue(double measureValue)
{
	if (!IsValidMeasureValue(measureValue))
	{
		measureValue = std::isnan(measureValue) ? 0.0 : std::clamp(measureValue, -kMaxAbsMeasureValue, kMaxAbsMeasureValue);
	}

	const double measureIdxDouble = std::floor(measureValue);
	std::int64_t measureIdx = static_cast<std::int64_t>(measureIdxDouble);

	// Tiny negative values (e.g. -1e-20) leave a remainder of exactly 1.0
	const double remainder = measureValue - measureIdxDouble;
	if (remainder >= 1.0)
	{
		return { .measureIdx = measureIdx + 1, .fraction = Position(0) };
	}

	Position fraction = ApproximateFraction(remainder, kMaxMeasureValueDenominator);

	// e.g. 0.9999 is rounded up to the next measure
	if (fraction >= Position(1))
	{
		++measureIdx;
		fraction = Position(0);
	}

	return { .measureIdx = measureIdx, .fraction = fraction };
}

bool smchart::IsValidMeasureValue(double measureValue)
{
	return std::isfinite(measureValue) && std::abs(measureValue) <= kMaxAbsMeasureValue;
}

bool smchart::IsValidTempo(double bpm)
{
	return std::isfinite(bpm) && bpm > 0.0;
}

bool smchart::IsRepresentableMs(double ms)
{
	// 2^63, exactly representable as a double
	constexpr double kInt64Limit = 9223372036854775808.0;
	return std::isfinite(ms) && ms > -kInt64Limit && ms < kInt64Limit;
}

std::vector<smchart::TempoSegment> smchart::ResolveTempoSegments(const BeatInfo& beatInfo, double offsetMs)
{
	std::vector<TempoSegment> segments;
	const bool hasInvalidTempoChange = std::any_of(beatInfo.bpm.begin(), beatInfo.bpm.end(),
		[](const TempoChange& tempoChange) { return !IsValidMeasureValue(tempoChange.measureValue) || !IsValidTempo(tempoChange.bpm); });
	if (beatInfo.bpm.empty() || hasInvalidTempoChange)
	{
		return segments;
	}

	segments.reserve(beatInfo.bpm.size());
	for (const TempoChange& tempoChange : beatInfo.bpm)
	{
		const MeasurePosition measurePos = SplitMeasureValue(tempoChange.measureValue);

		// The first tempo change starts at the chart offset
		double startMs = offsetMs;
		if (!segments.empty())
		{
			startMs = SegmentPositionToMs(segments.back(), measurePos.measureIdx, measurePos.fraction);
		}

		segments.push_back({
			.measureIdx = measurePos.measureIdx,
			.fraction = measurePos.fraction,
			.bpm = tempoChange.bpm,
			.startMs = startMs,
		});
	}

	return segments;
}

std::vector<smchart::TempoSegment> smchart::ResolveTempoSegments(const ChartData& chartData)
{
	return ResolveTempoSegments(chartData.beat, chartData.meta.offset.value_or(0.0) * 1000.0);
}

bool smchart::IsSegmentReached(const TempoSegment& segment, std::int64_t measureIdx, const Position& pos)
{
	return measureIdx > segment.measureIdx || (measureIdx == segment.measureIdx && segment.fraction <= pos);
}

smchart::Position smchart::MeasureDelta(const TempoSegment& segment, std::int64_t measureIdx, const Position& pos)
{
	return Position(measureIdx - segment.measureIdx) + (pos - segment.fraction);
}

double smchart::SegmentPositionToMs(const TempoSegment& segment, std::int64_t measureIdx, const Position& pos)
{
	return segment.startMs + PositionToDouble(MeasureDelta(segment, measureIdx, pos)) * kMsPerMeasureAtOneBPM / segment.bpm;
}

double smchart::MeasurePositionToMs(std::int64_t measureIdx, const Position& pos, const std::vector<TempoSegment>& segments)
{
	if (segments.empty())
	{
		return 0.0;
	}

	return SegmentPositionToMs(*SegmentItrAt(segments, measureIdx, pos), measureIdx, pos);
}

double smchart::TempoAt(std::int64_t measureIdx, const Position& pos, const std::vector<TempoSegment>& segments)
{
	if (segments.empty())
	{
		return 0.0;
	}

	return SegmentItrAt(segments, measureIdx, pos)->bpm;
}

smchart::TempoSegmentCursor::TempoSegmentCursor(const std::vector<TempoSegment>& segments)
	: m_pSegments(&segments)
{
	if (segments.empty())
	{
		throw std::invalid_argument("TempoSegmentCursor requires at least one tempo segment");
	}
}

const smchart::TempoSegment& smchart::TempoSegmentCursor::current() const
{
	return (*m_pSegments)[m_currentIdx];
}

const smchart::TempoSegment* smchart::TempoSegmentCursor::next() const
{
	if (m_currentIdx + 1 >= m_pSegments->size())
	{
		return nullptr;
	}
	return &(*m_pSegments)[m_currentIdx + 1];
}

bool smchart::TempoSegmentCursor::advanceTo(std::int64_t measureIdx, const Position& pos)
{
	bool advanced = false;

	// Several tempo changes may lie between two consecutive rows, so a single step is not enough
	while (const TempoSegment* pNext = next())
	{
		if (!IsSegmentReached(*pNext, measureIdx, pos))
		{
			break;
		}
		++m_currentIdx;
		advanced = true;
	}
	return advanced;
}
