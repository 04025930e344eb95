#include "smchart/error.hpp"

const char *smchart::GetErrorString(smchart::ErrorType errorType)
{
	switch (errorType)
	{
	case smchart::ErrorType::None:
		return "";
	case smchart::ErrorType::GeneralIOError:
		return "IO error";
	case smchart::ErrorType::FileNotFound:
		return "File not found";
	case smchart::ErrorType::CouldNotOpenInputFileStream:
		return "Could not open input file stream";
	case smchart::ErrorType::CouldNotOpenOutputFileStream:
		return "Could not open output file stream";
	case smchart::ErrorType::GeneralChartFormatError:
		return "Chart format error";
	case smchart::ErrorType::JSONParseError:
		return "JSON parse error";
	default:
		return "Unknown error";
	}
}
