#include "smchart/util/score_utils.hpp"

double smchart::WifePoints(const OffsetRecord& record, double ts)
{
	switch (record.type)
	{
	case NoteType::Tap:
	case NoteType::Hold:
	case NoteType::Roll:
	case NoteType::Lift:
	{
		if (!record.offsetMs.has_value())
		{
			return kWifeMissPoints;
		}

		const auto offsetMs = static_cast<double>(*record.offsetMs);
		const double aveDeviation = kWifeAveDeviationMs * ts;
		double y = 1.0 - std::pow(2.0, -offsetMs * offsetMs / (aveDeviation * aveDeviation));
		y *= y;
		return (kWifeMaxPoints - kWifeMissPoints) * (1.0 - y) + kWifeMissPoints;
	}

	case NoteType::Fake:
	case NoteType::HoldEnd:
		return 0.0;

	case NoteType::Mine:
		return record.offsetMs.has_value() ? kWifeMissPoints : 0.0;
	}
	return 0.0;
}

double smchart::MaxPoints(NoteType type)
{
	switch (type)
	{
	case NoteType::Tap:
	case NoteType::Hold:
	case NoteType::Roll:
	case NoteType::Lift:
		return kWifeMaxPoints;

	case NoteType::Fake:
	case NoteType::Mine:
	case NoteType::HoldEnd:
		return 0.0;
	}
	return 0.0;
}

bool smchart::IsScorable(NoteType type)
{
	return MaxPoints(type) > 0.0;
}

void smchart::ScoreAccumulator::add(const OffsetRecord& record)
{
	m_points += WifePoints(record, m_ts);
	m_maxPoints += MaxPoints(record.type);
	++m_numRecords;
}

double smchart::CalculateScore(const OffsetData& offsetData, double ts)
{
	ScoreAccumulator accumulator(ts);
	for (const auto& column : offsetData.columns)
	{
		for (const OffsetRecord& record : column)
		{
			accumulator.add(record);
		}
	}
	return accumulator.ratio();
}

double smchart::CalculateScore(const std::vector<OffsetRecord>& records, double ts)
{
	ScoreAccumulator accumulator(ts);
	for (const OffsetRecord& record : records)
	{
		accumulator.add(record);
	}
	return accumulator.ratio();
}

bool smchart::HasScorableNotes(const OffsetData& offsetData)
{
	for (const auto& column : offsetData.columns)
	{
		if (HasScorableNotes(column))
		{
			return true;
		}
	}
	return false;
}

bool smchart::HasScorableNotes(const std::vector<OffsetRecord>& records)
{
	return std::any_of(records.begin(), records.end(),
		[](const OffsetRecord& record) { return IsScorable(record.type); });
}
