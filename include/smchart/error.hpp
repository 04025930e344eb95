#pragma once

namespace smchart
{
	enum class ErrorType : int
	{
		None = 0,

		GeneralIOError = 10000,
		FileNotFound = 10001,
		CouldNotOpenInputFileStream = 10002,
		CouldNotOpenOutputFileStream = 10003,

		GeneralChartFormatError = 20000,
		JSONParseError = 20001,

		UnknownError = 90000,
	};

	[[nodiscard]]
	const char *GetErrorString(ErrorType errorType);
}
