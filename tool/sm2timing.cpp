#include <iostream>
#include <fstream>
#include <filesystem>
#include "smchart/smchart.hpp"

enum ExitCode : int
{
	kExitSuccess = 0,
	kExitNoArgument,
	kExitError,
};

void PrintHelp()
{
	std::cerr <<
		"sm2timing chart converter\n"
		"  Usage: sm2timing [SM file(s)...]\n"
		"  Timing file(s) are saved in the same folder with the extension \".timing.json\".\n";
}

void PrintError(smchart::ErrorType errorType)
{
	std::cerr << "Error: " << smchart::GetErrorString(errorType) << '\n';
}

void PrintWarnings(const std::vector<std::string>& warnings)
{
	for (const std::string& warning : warnings)
	{
		std::cerr << "Warning: " << warning << '\n';
	}
}

bool DoConvert(const char *szInputFilePath)
{
	// Input
	std::cout << szInputFilePath << '\n';
	std::filesystem::path filePath(szInputFilePath);
	const smchart::ChartData chartData = smchart::LoadSMChartData(filePath.string());
	if (chartData.error != smchart::ErrorType::None)
	{
		PrintError(chartData.error);
		std::cout << std::endl;
		return false;
	}
	PrintWarnings(chartData.warnings);

	if (chartData.beat.bpm.empty())
	{
		std::cerr << "Warning: The chart has no tempo changes. No notes are timed.\n";
	}

	const std::vector<smchart::PlainTimingData> timingDataList = smchart::CreateTimingDataList(chartData, 1.0);

	// Output
	std::cout << "-> ";
	filePath.replace_extension(".timing.json");
	const smchart::ErrorType error = smchart::SaveTimingJSON(filePath.string(), chartData, timingDataList);
	if (error != smchart::ErrorType::None)
	{
		PrintError(error);
		std::cout << std::endl;
		return false;
	}
	std::cout << "Saved: " << filePath.string() << '\n' << std::endl;
	return true;
}

int main(int argc, char *argv[])
{
	if (argc <= 1)
	{
		PrintHelp();
		return kExitNoArgument;
	}

	bool allSucceeded = true;
	try
	{
		for (int i = 1; i < argc; ++i)
		{
			if (!DoConvert(argv[i]))
			{
				allSucceeded = false;
			}
		}
	}
	catch (const std::exception& e)
	{
		std::cerr << "Error: Uncaught exception '" << e.what() << "'\n";
		return kExitError;
	}

	return allSucceeded ? kExitSuccess : kExitError;
}
