#ifndef SMCHART_WITHOUT_JSON_DEPENDENCY
#include "smchart/io/timing_json_io.hpp"
#include <fstream>
#include <cmath>
#include <nlohmann/json.hpp>

namespace
{
	using namespace smchart;

	void Write(nlohmann::json& json, const char* key, nlohmann::json&& value)
	{
		if (!value.is_object() || !value.empty())
		{
			json.emplace(key, std::move(value)); // Note: json becomes object if it is null
		}
	}

	template <typename T>
	void Write(nlohmann::json& json, const char* key, const T& value)
	{
		if constexpr (std::is_floating_point_v<T>)
		{
			json.emplace(key, RemoveFloatingPointError(value));
		}
		else
		{
			json.emplace(key, value);
		}
	}

	template <typename T>
	void Write(nlohmann::json& json, const char* key, const std::optional<T>& value)
	{
		if (value.has_value())
		{
			Write(json, key, *value);
		}
	}

	void Write(nlohmann::json& json, const char* key, const std::string& value, std::string_view defaultValue)
	{
		if (value != defaultValue)
		{
			json.emplace(key, value);
		}
	}

	nlohmann::json ToJSON(const MetaInfo& d)
	{
		nlohmann::json j = nlohmann::json::object();
		Write(j, "title", d.title);
		Write(j, "offset", d.offset);
		Write(j, "disp_bpm", d.dispBPM);
		return j;
	}

	nlohmann::json ToJSON(const NotesHeader& d)
	{
		nlohmann::json j = nlohmann::json::object();
		Write(j, "steps_type", d.stepsType, "");
		Write(j, "description", d.description, "");
		Write(j, "difficulty", d.difficulty, "");
		Write(j, "meter", d.meter, "");
		Write(j, "radar_values", d.radarValues, "");
		return j;
	}

	nlohmann::json ToJSON(const PlainTimingData& d)
	{
		nlohmann::json columnsJSON = nlohmann::json::array();
		for (const auto& column : d.columns)
		{
			nlohmann::json columnJSON = nlohmann::json::array();
			for (const auto& note : column)
			{
				nlohmann::json noteJSON = nlohmann::json::object();
				Write(noteJSON, "ms", note.ms);
				Write(noteJSON, "type", std::string(NoteTypeToString(note.type)));
				columnJSON.push_back(std::move(noteJSON));
			}
			columnsJSON.push_back(std::move(columnJSON));
		}
		return columnsJSON;
	}

	nlohmann::json ToJSON(const OffsetRecord& d)
	{
		nlohmann::json j = nlohmann::json::object();
		if (d.offsetMs.has_value())
		{
			j.emplace("offset", *d.offsetMs);
		}
		else
		{
			j.emplace("offset", nullptr);
		}
		Write(j, "type", std::string(NoteTypeToString(d.type)));
		return j;
	}

	std::optional<OffsetRecord> ParseOffsetRecord(const nlohmann::json& j, std::vector<std::string>& warnings)
	{
		if (!j.is_object())
		{
			warnings.push_back("Invalid offset record format");
			return std::nullopt;
		}

		if (!j.contains("type") || !j["type"].is_string())
		{
			warnings.push_back("Offset record without 'type' is ignored");
			return std::nullopt;
		}

		const std::string typeStr = j["type"].get<std::string>();
		const std::optional<NoteType> type = StringToNoteType(typeStr);
		if (!type.has_value())
		{
			warnings.push_back("Offset record with unknown type '" + typeStr + "' is ignored");
			return std::nullopt;
		}

		OffsetRecord record{ .offsetMs = std::nullopt, .type = *type };
		if (j.contains("offset") && !j["offset"].is_null())
		{
			if (!j["offset"].is_number())
			{
				warnings.push_back("Offset record with non-numeric 'offset' is ignored");
				return std::nullopt;
			}
			record.offsetMs = static_cast<std::int64_t>(std::llround(j["offset"].get<double>()));
		}

		return record;
	}
}

smchart::ErrorType smchart::SaveTimingJSON(std::ostream& stream, const ChartData& chartData, const std::vector<PlainTimingData>& timingDataList)
{
	if (!stream.good())
	{
		return ErrorType::GeneralIOError;
	}

	if (timingDataList.size() != chartData.notes.size())
	{
		return ErrorType::GeneralChartFormatError;
	}

	nlohmann::json chartsJSON = nlohmann::json::array();
	for (std::size_t i = 0; i < timingDataList.size(); ++i)
	{
		nlohmann::json chartJSON = nlohmann::json::object();
		Write(chartJSON, "header", ToJSON(chartData.notes[i].header));
		Write(chartJSON, "columns", ToJSON(timingDataList[i]));
		chartsJSON.push_back(std::move(chartJSON));
	}

	nlohmann::json json = nlohmann::json::object();
	Write(json, "version", std::string(kTimingJSONFormatVersion));
	Write(json, "meta", ToJSON(chartData.meta));
	Write(json, "charts", std::move(chartsJSON));

	stream << json.dump(-1, ' ', false, nlohmann::detail::error_handler_t::replace);

	return ErrorType::None;
}

smchart::ErrorType smchart::SaveTimingJSON(const std::string& filePath, const ChartData& chartData, const std::vector<PlainTimingData>& timingDataList)
{
	std::ofstream ofs(filePath);
	if (!ofs.good())
	{
		return ErrorType::CouldNotOpenOutputFileStream;
	}
	return SaveTimingJSON(ofs, chartData, timingDataList);
}

smchart::OffsetJSONData smchart::LoadOffsetJSON(std::istream& stream)
{
	OffsetJSONData offsetJSONData;
	if (!stream.good())
	{
		offsetJSONData.error = ErrorType::GeneralIOError;
		return offsetJSONData;
	}

	try
	{
		const nlohmann::json j = nlohmann::json::parse(stream);

		if (!j.is_object() || !j.contains("columns") || !j["columns"].is_array())
		{
			offsetJSONData.error = ErrorType::JSONParseError;
			offsetJSONData.warnings.push_back("Missing required field: columns");
			return offsetJSONData;
		}

		const nlohmann::json& columnsJSON = j["columns"];
		if (columnsJSON.size() > kNumColumnsSZ)
		{
			offsetJSONData.warnings.push_back("Columns beyond column " + std::to_string(kNumColumns) + " are ignored");
		}

		for (std::size_t column = 0; column < std::min(columnsJSON.size(), kNumColumnsSZ); ++column)
		{
			const nlohmann::json& columnJSON = columnsJSON[column];
			if (!columnJSON.is_array())
			{
				offsetJSONData.warnings.push_back("Column " + std::to_string(column) + " is not an array and is ignored");
				continue;
			}

			for (const nlohmann::json& recordJSON : columnJSON)
			{
				if (const std::optional<OffsetRecord> record = ParseOffsetRecord(recordJSON, offsetJSONData.warnings))
				{
					offsetJSONData.offsets.add(*record, column);
				}
			}
		}
	}
	catch (const nlohmann::json::parse_error& e)
	{
		offsetJSONData.error = ErrorType::JSONParseError;
		offsetJSONData.warnings.push_back("JSON parse error: " + std::string(e.what()));
	}
	catch (const nlohmann::json::type_error& e)
	{
		offsetJSONData.error = ErrorType::JSONParseError;
		offsetJSONData.warnings.push_back("JSON type error: " + std::string(e.what()));
	}

	return offsetJSONData;
}

smchart::OffsetJSONData smchart::LoadOffsetJSON(const std::string& filePath)
{
	std::ifstream ifs(filePath);
	if (!ifs.good())
	{
		OffsetJSONData offsetJSONData;
		offsetJSONData.error = ErrorType::CouldNotOpenInputFileStream;
		return offsetJSONData;
	}
	return LoadOffsetJSON(ifs);
}

smchart::ErrorType smchart::SaveOffsetJSON(std::ostream& stream, const OffsetData& offsetData)
{
	if (!stream.good())
	{
		return ErrorType::GeneralIOError;
	}

	nlohmann::json columnsJSON = nlohmann::json::array();
	for (const auto& column : offsetData.columns)
	{
		nlohmann::json columnJSON = nlohmann::json::array();
		for (const OffsetRecord& record : column)
		{
			columnJSON.push_back(ToJSON(record));
		}
		columnsJSON.push_back(std::move(columnJSON));
	}

	nlohmann::json json = nlohmann::json::object();
	Write(json, "version", std::string(kTimingJSONFormatVersion));
	Write(json, "columns", std::move(columnsJSON));

	stream << json.dump(-1, ' ', false, nlohmann::detail::error_handler_t::replace);

	return ErrorType::None;
}

smchart::ErrorType smchart::SaveOffsetJSON(const std::string& filePath, const OffsetData& offsetData)
{
	std::ofstream ofs(filePath);
	if (!ofs.good())
	{
		return ErrorType::CouldNotOpenOutputFileStream;
	}
	return SaveOffsetJSON(ofs, offsetData);
}
#endif
