#include <catch2/catch.hpp>
#include <smchart/smchart.hpp>
#include <limits>
#include <sstream>
#include <tuple>

extern std::string g_assetsDir;

namespace
{
	smchart::BeatInfo MakeBeatInfo(std::initializer_list<smchart::TempoChange> tempoChanges)
	{
		smchart::BeatInfo beatInfo;
		beatInfo.bpm = tempoChanges;
		return beatInfo;
	}

	smchart::NoteInfo MakeSingleNoteInfo(std::size_t numMeasures, smchart::NoteType type = smchart::NoteType::Tap)
	{
		smchart::NoteInfo noteInfo;
		noteInfo.measures.resize(numMeasures);
		for (auto& measure : noteInfo.measures) {
			measure[smchart::Position(0)] = { { type, 0 } };
		}
		return noteInfo;
	}

	std::vector<std::int64_t> Times(const std::vector<smchart::TimedNote<std::monostate>>& column)
	{
		std::vector<std::int64_t> times;
		for (const auto& note : column) {
			times.push_back(note.ms);
		}
		return times;
	}
}

TEST_CASE("Measure value splitting", "[timing]") {
	SECTION("Whole measures") {
		const auto measurePos = smchart::SplitMeasureValue(3.0);
		REQUIRE(measurePos.measureIdx == 3);
		REQUIRE(measurePos.fraction == smchart::Position(0));
	}

	SECTION("Simple fractions") {
		const auto half = smchart::SplitMeasureValue(0.5);
		REQUIRE(half.measureIdx == 0);
		REQUIRE(half.fraction == smchart::Position(1, 2));

		const auto third = smchart::SplitMeasureValue(2.333333);
		REQUIRE(third.measureIdx == 2);
		REQUIRE(third.fraction == smchart::Position(1, 3));

		const auto sixteenth = smchart::SplitMeasureValue(1.0625);
		REQUIRE(sixteenth.measureIdx == 1);
		REQUIRE(sixteenth.fraction == smchart::Position(1, 16));
	}

	SECTION("Finest division") {
		const auto measurePos = smchart::SplitMeasureValue(1.0 / 192.0);
		REQUIRE(measurePos.measureIdx == 0);
		REQUIRE(measurePos.fraction == smchart::Position(1, 192));
		REQUIRE(smchart::SplitMeasureValue(0.123456).fraction.denominator() <= smchart::kMaxMeasureValueDenominator);
	}

	SECTION("Values just below a measure boundary carry over") {
		const auto measurePos = smchart::SplitMeasureValue(0.9999);
		REQUIRE(measurePos.measureIdx == 1);
		REQUIRE(measurePos.fraction == smchart::Position(0));
	}

	SECTION("Negative values") {
		const auto measurePos = smchart::SplitMeasureValue(-0.5);
		REQUIRE(measurePos.measureIdx == -1);
		REQUIRE(measurePos.fraction == smchart::Position(1, 2));
	}

	SECTION("Tiny negative values round to the measure boundary") {
		const auto measurePos = smchart::SplitMeasureValue(-1e-20);
		REQUIRE(measurePos.measureIdx == 0);
		REQUIRE(measurePos.fraction == smchart::Position(0));

		const auto measurePos2 = smchart::SplitMeasureValue(3.0 - 1e-15);
		REQUIRE(measurePos2.measureIdx == 3);
		REQUIRE(measurePos2.fraction == smchart::Position(0));
	}

	SECTION("Out-of-range values are clamped") {
		REQUIRE_FALSE(smchart::IsValidMeasureValue(1e30));
		REQUIRE_FALSE(smchart::IsValidMeasureValue(std::numeric_limits<double>::infinity()));
		REQUIRE(smchart::IsValidMeasureValue(-smchart::kMaxAbsMeasureValue));

		const auto measurePos = smchart::SplitMeasureValue(1e30);
		REQUIRE(measurePos.measureIdx == static_cast<std::int64_t>(smchart::kMaxAbsMeasureValue));
		REQUIRE(measurePos.fraction == smchart::Position(0));

		const auto measurePos2 = smchart::SplitMeasureValue(-std::numeric_limits<double>::infinity());
		REQUIRE(measurePos2.measureIdx == -static_cast<std::int64_t>(smchart::kMaxAbsMeasureValue));

		const auto measurePos3 = smchart::SplitMeasureValue(std::numeric_limits<double>::quiet_NaN());
		REQUIRE(measurePos3.measureIdx == 0);
		REQUIRE(measurePos3.fraction == smchart::Position(0));
	}
}

TEST_CASE("Tempo segment resolution", "[timing]") {
	SECTION("Start times accumulate at the previous tempo") {
		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 }, { 2.0, 240.0 } }), 0.0);
		REQUIRE(segments.size() == 2);
		REQUIRE(segments[0].startMs == Approx(0.0));
		REQUIRE(segments[0].bpm == Approx(120.0));
		REQUIRE(segments[1].measureIdx == 2);
		REQUIRE(segments[1].fraction == smchart::Position(0));
		REQUIRE(segments[1].startMs == Approx(4000.0));
		REQUIRE(segments[1].bpm == Approx(240.0));
	}

	SECTION("Fractional tempo changes") {
		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 60.0 }, { 0.25, 120.0 }, { 1.5, 240.0 } }), 0.0);
		REQUIRE(segments.size() == 3);
		REQUIRE(segments[1].fraction == smchart::Position(1, 4));
		REQUIRE(segments[1].startMs == Approx(1000.0));
		REQUIRE(segments[2].measureIdx == 1);
		REQUIRE(segments[2].fraction == smchart::Position(1, 2));
		REQUIRE(segments[2].startMs == Approx(1000.0 + 1.25 * 2000.0));
	}

	SECTION("Offset shifts every segment") {
		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 }, { 1.0, 60.0 } }), 250.0);
		REQUIRE(segments[0].startMs == Approx(250.0));
		REQUIRE(segments[1].startMs == Approx(2250.0));
	}

	SECTION("Start times are non-decreasing") {
		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 95.0 }, { 1.2, 180.0 }, { 3.75, 44.0 }, { 3.76, 300.0 }, { 10.0, 130.0 } }), -40.0);
		REQUIRE(segments.size() == 5);
		for (std::size_t i = 1; i < segments.size(); ++i) {
			REQUIRE(segments[i - 1].startMs <= segments[i].startMs);
		}
	}

	SECTION("No tempo changes") {
		REQUIRE(smchart::ResolveTempoSegments(smchart::BeatInfo{}, 0.0).empty());
	}

	SECTION("Tiny negative first tempo change") {
		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { -1e-20, 120.0 }, { 1.0, 240.0 } }), 0.0);
		REQUIRE(segments.size() == 2);
		REQUIRE(segments[0].measureIdx == 0);
		REQUIRE(segments[1].startMs == Approx(2000.0));

		const auto timingData = smchart::CreateTimingData(MakeSingleNoteInfo(2), segments, 1.0);
		REQUIRE(Times(timingData.columns[0]) == std::vector<std::int64_t>{ 0, 2000 });
	}

	SECTION("Invalid tempo changes give no segments") {
		REQUIRE(smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 }, { 1e30, 140.0 } }), 0.0).empty());
		REQUIRE(smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 }, { std::numeric_limits<double>::quiet_NaN(), 140.0 } }), 0.0).empty());
		REQUIRE(smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 0.0 } }), 0.0).empty());
		REQUIRE(smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, -120.0 } }), 0.0).empty());
		REQUIRE(smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, std::numeric_limits<double>::infinity() } }), 0.0).empty());
	}

	SECTION("Chart offset is taken from meta") {
		smchart::ChartData chartData;
		chartData.meta.offset = 0.1;
		chartData.beat = MakeBeatInfo({ { 0.0, 120.0 } });
		const auto segments = smchart::ResolveTempoSegments(chartData);
		REQUIRE(segments.size() == 1);
		REQUIRE(segments[0].startMs == Approx(100.0));

		chartData.meta.offset = std::nullopt;
		REQUIRE(smchart::ResolveTempoSegments(chartData)[0].startMs == Approx(0.0));
	}
}

TEST_CASE("Tempo segment lookup", "[timing]") {
	const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 }, { 1.0, 240.0 }, { 2.5, 60.0 } }), 0.0);

	SECTION("Segment reach") {
		REQUIRE(smchart::IsSegmentReached(segments[1], 1, smchart::Position(0)));
		REQUIRE(smchart::IsSegmentReached(segments[1], 2, smchart::Position(0)));
		REQUIRE_FALSE(smchart::IsSegmentReached(segments[1], 0, smchart::Position(3, 4)));
		REQUIRE(smchart::IsSegmentReached(segments[2], 2, smchart::Position(1, 2)));
		REQUIRE_FALSE(smchart::IsSegmentReached(segments[2], 2, smchart::Position(1, 3)));
	}

	SECTION("Exact measure delta") {
		REQUIRE(smchart::MeasureDelta(segments[2], 3, smchart::Position(1, 3)) == smchart::Position(5, 6));
		REQUIRE(smchart::MeasureDelta(segments[0], 0, smchart::Position(0)) == smchart::Position(0));
	}

	SECTION("Random-access times") {
		REQUIRE(smchart::MeasurePositionToMs(0, smchart::Position(1, 2), segments) == Approx(1000.0));
		REQUIRE(smchart::MeasurePositionToMs(1, smchart::Position(0), segments) == Approx(2000.0));
		REQUIRE(smchart::MeasurePositionToMs(2, smchart::Position(0), segments) == Approx(3000.0));
		REQUIRE(smchart::MeasurePositionToMs(2, smchart::Position(1, 2), segments) == Approx(3500.0));
		REQUIRE(smchart::MeasurePositionToMs(3, smchart::Position(0), segments) == Approx(5500.0));

		// Before the first segment, its tempo is extrapolated
		REQUIRE(smchart::MeasurePositionToMs(-1, smchart::Position(0), segments) == Approx(-2000.0));

		REQUIRE(smchart::MeasurePositionToMs(1, smchart::Position(0), {}) == 0.0);
	}

	SECTION("Tempo at position") {
		REQUIRE(smchart::TempoAt(0, smchart::Position(0), segments) == Approx(120.0));
		REQUIRE(smchart::TempoAt(1, smchart::Position(0), segments) == Approx(240.0));
		REQUIRE(smchart::TempoAt(2, smchart::Position(1, 4), segments) == Approx(240.0));
		REQUIRE(smchart::TempoAt(2, smchart::Position(1, 2), segments) == Approx(60.0));
		REQUIRE(smchart::TempoAt(100, smchart::Position(0), segments) == Approx(60.0));
		REQUIRE(smchart::TempoAt(0, smchart::Position(0), {}) == 0.0);
	}
}

TEST_CASE("Tempo segment cursor", "[timing]") {
	const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 }, { 1.0, 150.0 }, { 1.25, 180.0 }, { 1.5, 200.0 } }), 0.0);

	SECTION("Starts at the first segment") {
		smchart::TempoSegmentCursor cursor(segments);
		REQUIRE(cursor.currentIdx() == 0);
		REQUIRE(cursor.current().bpm == Approx(120.0));
		REQUIRE(cursor.next() != nullptr);
		REQUIRE(cursor.next()->bpm == Approx(150.0));
	}

	SECTION("Does not advance before the lookahead segment") {
		smchart::TempoSegmentCursor cursor(segments);
		REQUIRE_FALSE(cursor.advanceTo(0, smchart::Position(7, 8)));
		REQUIRE(cursor.currentIdx() == 0);
	}

	SECTION("Advances past several segments at once") {
		smchart::TempoSegmentCursor cursor(segments);
		REQUIRE(cursor.advanceTo(1, smchart::Position(3, 4)));
		REQUIRE(cursor.currentIdx() == 3);
		REQUIRE(cursor.current().bpm == Approx(200.0));
		REQUIRE(cursor.next() == nullptr);

		REQUIRE_FALSE(cursor.advanceTo(5, smchart::Position(0)));
		REQUIRE(cursor.currentIdx() == 3);
	}

	SECTION("Advances exactly at a segment start") {
		smchart::TempoSegmentCursor cursor(segments);
		REQUIRE(cursor.advanceTo(1, smchart::Position(0)));
		REQUIRE(cursor.currentIdx() == 1);
		REQUIRE(cursor.advanceTo(1, smchart::Position(1, 4)));
		REQUIRE(cursor.currentIdx() == 2);
	}

	SECTION("Empty segments are rejected") {
		const std::vector<smchart::TempoSegment> empty;
		REQUIRE_THROWS_AS(smchart::TempoSegmentCursor(empty), std::invalid_argument);
	}
}

TEST_CASE("Timing data conversion", "[timing]") {
	SECTION("Single tempo") {
		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 } }), 0.0);
		const auto timingData = smchart::CreateTimingData(MakeSingleNoteInfo(3), segments, 1.0);
		REQUIRE(timingData.size() == 3);
		REQUIRE(Times(timingData.columns[0]) == std::vector<std::int64_t>{ 0, 2000, 4000 });
		REQUIRE(timingData.columns[1].empty());
	}

	SECTION("Tempo change between rows") {
		smchart::NoteInfo noteInfo;
		noteInfo.measures.resize(2);
		noteInfo.measures[0][smchart::Position(0)] = { { smchart::NoteType::Tap, 1 } };
		noteInfo.measures[1][smchart::Position(1, 2)] = { { smchart::NoteType::Tap, 1 } };

		// Both tempo changes lie between the two rows
		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 }, { 0.5, 240.0 }, { 1.25, 60.0 } }), 0.0);
		const auto timingData = smchart::CreateTimingData(noteInfo, segments, 1.0);
		REQUIRE(Times(timingData.columns[1]) == std::vector<std::int64_t>{ 0, 1000 + 750 + 1000 });
	}

	SECTION("Bundled chart") {
		const auto chartData = smchart::LoadSMChartData(g_assetsDir + "/barebones.sm");
		REQUIRE(chartData.error == smchart::ErrorType::None);

		const auto timingDataList = smchart::CreateTimingDataList(chartData, 1.0);
		REQUIRE(timingDataList.size() == 1);

		const auto& timingData = timingDataList[0];
		REQUIRE(timingData.size() == 9);
		REQUIRE(Times(timingData.columns[0]) == std::vector<std::int64_t>{ 100, 2100, 2600 });
		REQUIRE(Times(timingData.columns[1]) == std::vector<std::int64_t>{ 600 });
		REQUIRE(Times(timingData.columns[2]) == std::vector<std::int64_t>{ 1100 });
		REQUIRE(Times(timingData.columns[3]) == std::vector<std::int64_t>{ 1600, 2600, 2850, 3100 });

		REQUIRE(timingData.columns[0][2].type == smchart::NoteType::Mine);
		REQUIRE(timingData.columns[3][1].type == smchart::NoteType::Hold);
		REQUIRE(timingData.columns[3][2].type == smchart::NoteType::HoldEnd);
		REQUIRE(timingData.columns[3][3].type == smchart::NoteType::Fake);
	}

	SECTION("Rate scales times") {
		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 } }), 0.0);
		const auto timingData = smchart::CreateTimingData(MakeSingleNoteInfo(3), segments, 2.0);
		REQUIRE(Times(timingData.columns[0]) == std::vector<std::int64_t>{ 0, 1000, 2000 });

		const auto slowTimingData = smchart::CreateTimingData(MakeSingleNoteInfo(2), segments, 0.5);
		REQUIRE(Times(slowTimingData.columns[0]) == std::vector<std::int64_t>{ 0, 4000 });
	}

	SECTION("Non-positive rate gives no notes") {
		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 } }), 0.0);
		REQUIRE(smchart::CreateTimingData(MakeSingleNoteInfo(2), segments, 0.0).empty());
		REQUIRE(smchart::CreateTimingData(MakeSingleNoteInfo(2), segments, -1.0).empty());
	}

	SECTION("No tempo segments gives no notes") {
		REQUIRE(smchart::CreateTimingData(MakeSingleNoteInfo(2), {}, 1.0).empty());

		smchart::ChartData chartData;
		chartData.notes.push_back(MakeSingleNoteInfo(2));
		const auto timingDataList = smchart::CreateTimingDataList(chartData, 1.0);
		REQUIRE(timingDataList.size() == 1);
		REQUIRE(timingDataList[0].empty());
	}

	SECTION("Notes beyond the last column are dropped") {
		smchart::NoteInfo noteInfo;
		noteInfo.measures.resize(1);
		noteInfo.measures[0][smchart::Position(0)] = { { smchart::NoteType::Tap, 3 }, { smchart::NoteType::Tap, 4 }, { smchart::NoteType::Tap, 7 } };

		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 } }), 0.0);
		const auto timingData = smchart::CreateTimingData(noteInfo, segments, 1.0);
		REQUIRE(timingData.size() == 1);
		REQUIRE(timingData.columns[3].size() == 1);
	}

	SECTION("Rows too late for a 64-bit time are dropped") {
		REQUIRE(smchart::IsRepresentableMs(-1.0e18));
		REQUIRE_FALSE(smchart::IsRepresentableMs(1.0e19));
		REQUIRE_FALSE(smchart::IsRepresentableMs(std::numeric_limits<double>::infinity()));
		REQUIRE_FALSE(smchart::IsRepresentableMs(std::numeric_limits<double>::quiet_NaN()));

		// 240000 / 1e-300 ms per measure
		const auto slowSegments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 1e-300 } }), 0.0);
		const auto slowTimingData = smchart::CreateTimingData(MakeSingleNoteInfo(3), slowSegments, 1.0);
		REQUIRE(Times(slowTimingData.columns[0]) == std::vector<std::int64_t>{ 0 });

		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 } }), 0.0);
		const auto tinyRateTimingData = smchart::CreateTimingData(MakeSingleNoteInfo(3), segments, 1e-300);
		REQUIRE(Times(tinyRateTimingData.columns[0]) == std::vector<std::int64_t>{ 0 });

		// Infinite start times propagate to every later segment
		const auto denormalSegments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 1e-320 }, { 1.0, 120.0 } }), 0.0);
		REQUIRE(smchart::CreateTimingData(MakeSingleNoteInfo(3), denormalSegments, 1.0).size() == 1);
	}

	SECTION("Times before the offset are truncated toward zero") {
		smchart::NoteInfo noteInfo;
		noteInfo.measures.resize(1);
		noteInfo.measures[0][smchart::Position(0)] = { { smchart::NoteType::Tap, 0 } };

		const auto segments = smchart::ResolveTempoSegments(MakeBeatInfo({ { 0.0, 120.0 } }), -2.5);
		const auto timingData = smchart::CreateTimingData(noteInfo, segments, 1.0);
		REQUIRE(timingData.columns[0][0].ms == -2);
	}

	SECTION("Sprite finder payload") {
		const auto chartData = smchart::LoadSMChartData(g_assetsDir + "/barebones.sm");
		REQUIRE(chartData.error == smchart::ErrorType::None);

		using Call = std::tuple<std::int64_t, double, smchart::Position, smchart::NoteType, std::size_t>;
		std::vector<Call> calls;
		const auto segments = smchart::ResolveTempoSegments(chartData);
		const auto timingData = smchart::CreateTimingData(chartData.notes[0], segments, 1.0,
			[&calls](std::int64_t measureIdx, double reserved, const smchart::Position& pos, smchart::NoteType type, std::size_t column) {
				calls.emplace_back(measureIdx, reserved, pos, type, column);
				return std::to_string(measureIdx) + ":" + std::to_string(column);
			});

		REQUIRE(calls.size() == 9);
		for (const auto& call : calls) {
			REQUIRE(std::get<1>(call) == 0.0);
		}
		REQUIRE(calls.front() == Call{ 0, 0.0, smchart::Position(0), smchart::NoteType::Tap, 0 });
		REQUIRE(calls.back() == Call{ 2, 0.0, smchart::Position(0), smchart::NoteType::Fake, 3 });

		REQUIRE(timingData.columns[3].back().payload == "2:3");
		REQUIRE(timingData.columns[0][1].payload == "1:0");
	}

	SECTION("Repeated conversion gives identical results") {
		const auto chartData = smchart::LoadSMChartData(g_assetsDir + "/barebones.sm");
		REQUIRE(smchart::CreateTimingDataList(chartData, 1.5) == smchart::CreateTimingDataList(chartData, 1.5));
	}
}
