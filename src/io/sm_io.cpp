#include "smchart/io/sm_io.hpp"
#include "smchart/util/timing_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <type_traits>

namespace
{
	using namespace smchart;

	constexpr char kFieldPrefix = '#';
	constexpr char kTagSeparator = ':';
	constexpr char kFieldTerminator = ';';
	constexpr char kTempoChangeSeparator = ',';
	constexpr char kTempoValueSeparator = '=';
	constexpr std::string_view kMeasureSeparator = ",";
	constexpr std::string_view kCommentPrefix = "//";
	constexpr std::string_view kWhitespaceChars = " \t\r\n";

	// "#NOTES" header: steps type, description, difficulty, meter, radar values
	constexpr std::size_t kNumNotesHeaderLines = 5;

	std::string_view Trim(std::string_view str)
	{
		const std::size_t first = str.find_first_not_of(kWhitespaceChars);
		if (first == std::string_view::npos)
		{
			return {};
		}
		const std::size_t last = str.find_last_not_of(kWhitespaceChars);
		return str.substr(first, last - first + 1);
	}

	std::string_view TrimRight(std::string_view str)
	{
		const std::size_t last = str.find_last_not_of(kWhitespaceChars);
		if (last == std::string_view::npos)
		{
			return {};
		}
		return str.substr(0, last + 1);
	}

	// Returns the text before the terminating ';'
	// (trailing whitespace is removed instead if the terminator is missing)
	std::string_view StripTerminator(std::string_view value)
	{
		const std::size_t terminatorIdx = value.find(kFieldTerminator);
		if (terminatorIdx == std::string_view::npos)
		{
			return TrimRight(value);
		}
		return value.substr(0, terminatorIdx);
	}

	std::string_view StripComment(std::string_view line)
	{
		const std::size_t commentIdx = line.find(kCommentPrefix);
		if (commentIdx == std::string_view::npos)
		{
			return line;
		}
		return line.substr(0, commentIdx);
	}

	std::pair<std::string_view, std::string_view> SplitField(std::string_view field)
	{
		const std::size_t separatorIdx = field.find(kTagSeparator);
		if (separatorIdx == std::string_view::npos)
		{
			return { field, std::string_view{} };
		}
		return { field.substr(0, separatorIdx), field.substr(separatorIdx + 1) };
	}

	std::vector<std::string_view> SplitLines(std::string_view str)
	{
		std::vector<std::string_view> lines;
		std::size_t cursor = 0;
		while (cursor <= str.size())
		{
			const std::size_t newlineIdx = str.find('\n', cursor);
			if (newlineIdx == std::string_view::npos)
			{
				lines.push_back(str.substr(cursor));
				break;
			}
			lines.push_back(str.substr(cursor, newlineIdx - cursor));
			cursor = newlineIdx + 1;
		}
		return lines;
	}

	std::optional<double> ParseDouble(std::string_view str)
	{
		const std::string s(Trim(str));
		if (s.empty())
		{
			return std::nullopt;
		}

		try
		{
			std::size_t numParsedChars = 0;
			const double value = std::stod(s, &numParsedChars);
			if (numParsedChars != s.size() || !std::isfinite(value))
			{
				return std::nullopt;
			}
			return value;
		}
		catch (const std::out_of_range&)
		{
			return std::nullopt;
		}
		catch (const std::invalid_argument&)
		{
			return std::nullopt;
		}
	}

	// Parses "time=tempo,time=tempo,...,time=tempo;"
	std::optional<std::vector<TempoChange>> ParseTempoChanges(std::string_view value)
	{
		const std::string_view body = StripTerminator(value);

		std::vector<TempoChange> tempoChanges;
		std::size_t cursor = 0;
		while (true)
		{
			const std::size_t separatorIdx = body.find(kTempoChangeSeparator, cursor);
			const std::string_view pairStr = (separatorIdx == std::string_view::npos)
				? body.substr(cursor)
				: body.substr(cursor, separatorIdx - cursor);

			const std::size_t equalIdx = pairStr.find(kTempoValueSeparator);
			if (equalIdx == std::string_view::npos)
			{
				return std::nullopt;
			}

			const std::optional<double> measureValue = ParseDouble(pairStr.substr(0, equalIdx));
			const std::optional<double> bpm = ParseDouble(pairStr.substr(equalIdx + 1));
			if (!measureValue.has_value() || !bpm.has_value() || !IsValidMeasureValue(*measureValue) || !IsValidTempo(*bpm))
			{
				return std::nullopt;
			}

			tempoChanges.push_back({ .measureValue = *measureValue, .bpm = *bpm });

			if (separatorIdx == std::string_view::npos)
			{
				break;
			}
			cursor = separatorIdx + 1;
		}

		return tempoChanges;
	}

	std::string TrimHeaderField(std::string_view line)
	{
		std::string_view field = Trim(line);
		if (!field.empty() && field.back() == kTagSeparator)
		{
			field.remove_suffix(1);
		}
		return std::string(Trim(field));
	}

	Measure ParseMeasure(const std::vector<std::string_view>& rowLines, bool* pHasOutOfRangeNote)
	{
		Measure measure;
		const auto numRows = static_cast<std::int64_t>(rowLines.size());
		for (std::int64_t rowIdx = 0; rowIdx < numRows; ++rowIdx)
		{
			const std::string_view line = rowLines[static_cast<std::size_t>(rowIdx)];

			NoteRow row;
			for (std::size_t column = 0; column < line.size(); ++column)
			{
				const std::optional<NoteType> type = CharToNoteType(line[column]);
				if (!type.has_value())
				{
					continue;
				}

				if (column >= kNumColumnsSZ)
				{
					*pHasOutOfRangeNote = true;
				}
				row.push_back({ .type = *type, .column = column });
			}

			// Note: boost::rational normalizes n/k to lowest terms
			measure.emplace(Position(rowIdx, numRows), std::move(row));
		}
		return measure;
	}

	NoteInfo ParseNoteInfo(std::string_view value, std::vector<std::string>& warnings, std::size_t chartIdx)
	{
		const std::vector<std::string_view> lines = SplitLines(StripTerminator(value));

		NoteInfo noteInfo;
		std::size_t lineIdx = 0;

		// Skip the rest of the "#NOTES:" line if it is blank
		if (!lines.empty() && Trim(lines.front()).empty())
		{
			++lineIdx;
		}

		const std::array<std::string*, kNumNotesHeaderLines> headerFields = {
			&noteInfo.header.stepsType,
			&noteInfo.header.description,
			&noteInfo.header.difficulty,
			&noteInfo.header.meter,
			&noteInfo.header.radarValues,
		};
		for (std::string* pHeaderField : headerFields)
		{
			if (lineIdx >= lines.size())
			{
				break;
			}
			*pHeaderField = TrimHeaderField(lines[lineIdx]);
			++lineIdx;
		}

		std::optional<std::size_t> firstOutOfRangeMeasureIdx;
		std::vector<std::string_view> rowLines;
		const auto commitMeasure = [&]()
		{
			bool hasOutOfRangeNote = false;
			noteInfo.measures.push_back(ParseMeasure(rowLines, &hasOutOfRangeNote));
			if (hasOutOfRangeNote && !firstOutOfRangeMeasureIdx.has_value())
			{
				firstOutOfRangeMeasureIdx = noteInfo.measures.size() - 1;
			}
			rowLines.clear();
		};

		for (; lineIdx < lines.size(); ++lineIdx)
		{
			const std::string_view line = Trim(StripComment(lines[lineIdx]));
			if (line == kMeasureSeparator)
			{
				// Empty measures are kept so that measure indices stay aligned
				commitMeasure();
				continue;
			}

			if (!line.empty())
			{
				rowLines.push_back(line);
			}
		}

		if (!rowLines.empty())
		{
			commitMeasure();
		}

		if (firstOutOfRangeMeasureIdx.has_value())
		{
			warnings.push_back(
				"Chart " + std::to_string(chartIdx) + " (" + noteInfo.header.stepsType + ") has notes beyond column " +
				std::to_string(kNumColumns) + " (first in measure " + std::to_string(*firstOutOfRangeMeasureIdx) + "); they are ignored.");
		}

		return noteInfo;
	}

	void SkipUTF8BOM(std::istream& stream)
	{
		char bom[3];
		stream.read(bom, 3);
		if (stream.gcount() == 3 &&
			bom[0] == '\xEF' &&
			bom[1] == '\xBB' &&
			bom[2] == '\xBF')
		{
			// BOM found, stream position is already after BOM
			return;
		}

		// No BOM or incomplete read, reset to beginning
		stream.clear();
		stream.seekg(0, std::ios_base::beg);
	}

	template <typename ChartDataType>
	void ApplyField(ChartDataType& chartData, std::string_view tag, std::string_view value)
	{
		if (tag == "TITLE")
		{
			chartData.meta.title = std::string(StripTerminator(value));
		}
		else if (tag == "OFFSET")
		{
			const std::optional<double> offset = ParseDouble(StripTerminator(value));
			if (offset.has_value())
			{
				// Positive "#OFFSET" means notes start later
				chartData.meta.offset = -*offset;
			}
			else
			{
				chartData.meta.offset = std::nullopt;
				chartData.warnings.push_back("Invalid #OFFSET value '" + std::string(Trim(StripTerminator(value))) + "' is ignored.");
			}
		}
		else if (tag == "BPMS")
		{
			std::optional<std::vector<TempoChange>> tempoChanges = ParseTempoChanges(value);
			if (!tempoChanges.has_value())
			{
				chartData.beat.bpm.clear();
				chartData.meta.dispBPM = std::nullopt;
				chartData.warnings.push_back("Invalid #BPMS value is ignored. The chart has no tempo changes.");
				return;
			}

			// The last tempo change in the source is used as the display tempo
			chartData.meta.dispBPM = tempoChanges->back().bpm;

			const auto byMeasureValue = [](const TempoChange& a, const TempoChange& b) { return a.measureValue < b.measureValue; };
			if (!std::is_sorted(tempoChanges->begin(), tempoChanges->end(), byMeasureValue))
			{
				std::stable_sort(tempoChanges->begin(), tempoChanges->end(), byMeasureValue);
				chartData.warnings.push_back("#BPMS entries are not in ascending order. They have been sorted.");
			}

			chartData.beat.bpm = std::move(*tempoChanges);
		}
		else if (tag == "NOTES")
		{
			if constexpr (std::is_same_v<ChartDataType, ChartData>)
			{
				chartData.notes.push_back(ParseNoteInfo(value, chartData.warnings, chartData.notes.size()));
			}
		}

		// Other tags are ignored
	}

	template <typename ChartDataType>
	ChartDataType CreateChartDataFromStream(std::istream& stream)
#ifdef __cpp_concepts
		requires std::is_same_v<ChartDataType, smchart::ChartData> || std::is_same_v<ChartDataType, smchart::MetaChartData>
#endif
	{
		if (!stream.good())
		{
			return { .error = ErrorType::GeneralIOError };
		}

		SkipUTF8BOM(stream);
		const std::string source{ std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>() };
		const std::string_view sourceView(source);

		ChartDataType chartData;

		// Text before the first '#' is not a field
		std::size_t cursor = sourceView.find(kFieldPrefix);
		while (cursor != std::string_view::npos)
		{
			const std::size_t nextCursor = sourceView.find(kFieldPrefix, cursor + 1);
			const std::string_view field = (nextCursor == std::string_view::npos)
				? sourceView.substr(cursor + 1)
				: sourceView.substr(cursor + 1, nextCursor - cursor - 1);

			const auto [tag, value] = SplitField(field);
			ApplyField(chartData, tag, value);

			cursor = nextCursor;
		}

		return chartData;
	}

	template <typename ChartDataType>
	ChartDataType CreateChartDataFromFile(const std::string& filePath)
	{
		if (!std::filesystem::exists(filePath))
		{
			return { .error = ErrorType::FileNotFound };
		}

		std::ifstream ifs(filePath, std::ios_base::binary);
		if (!ifs.good())
		{
			return { .error = ErrorType::CouldNotOpenInputFileStream };
		}

		return CreateChartDataFromStream<ChartDataType>(ifs);
	}
}

smchart::MetaChartData smchart::LoadSMMetaChartData(std::istream& stream)
{
	return CreateChartDataFromStream<MetaChartData>(stream);
}

smchart::MetaChartData smchart::LoadSMMetaChartData(const std::string& filePath)
{
	return CreateChartDataFromFile<MetaChartData>(filePath);
}

smchart::ChartData smchart::LoadSMChartData(std::istream& stream)
{
	return CreateChartDataFromStream<ChartData>(stream);
}

smchart::ChartData smchart::LoadSMChartData(const std::string& filePath)
{
	return CreateChartDataFromFile<ChartData>(filePath);
}
