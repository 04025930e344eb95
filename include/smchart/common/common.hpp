#pragma once
#include <algorithm>
#include <string>
#include <string_view>
#include <array>
#include <vector>
#include <map>
#include <optional>
#include <cmath>
#include <cstdint>
#include <boost/rational.hpp>

namespace smchart
{
	constexpr std::int32_t kNumColumns = 4;

	constexpr std::size_t kNumColumnsSZ = std::size_t{ kNumColumns };

	// Milliseconds per measure at 1 BPM (60,000 ms/min * 4 beats/measure, 4/4 time only)
	constexpr double kMsPerMeasureAtOneBPM = 240000.0;

	// Finest row division used when converting a floating-point measure value to a Position
	constexpr std::int64_t kMaxMeasureValueDenominator = 192;

	// Tempo changes further than this many measures from the chart start are rejected
	constexpr double kMaxAbsMeasureValue = 1048576.0;

	// Position within a measure (0 <= pos < 1 for rows), always kept reduced
	using Position = boost::rational<std::int64_t>;

	template <typename T>
	using ByPosition = std::map<Position, T>;

	template <typename T>
	using ByColumn = std::array<T, kNumColumnsSZ>;

	[[nodiscard]]
	inline double PositionToDouble(const Position& pos)
	{
		return boost::rational_cast<double>(pos);
	}

	[[nodiscard]]
	inline double RemoveFloatingPointError(double value)
	{
		// Round the value to eight decimal places (e.g. "0.700000004" -> "0.7")
		const double rounded = std::round(value * 1e8) / 1e8;

		// Return rounded only for almost exact values
		// (e.g. "0.700000001" -> "0.7",  "1.66666666667" -> "1.66666666667")
		if (std::abs(rounded - value) < 1e-9)
		{
			return rounded;
		}
		else
		{
			return value;
		}
	}

	[[nodiscard]]
	inline bool AlmostEquals(double a, double b)
	{
		return std::round(a * 1e8) == std::round(b * 1e8);
	}
}
