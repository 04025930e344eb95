#include <iostream>
#include <iomanip>
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
		"wifescore score calculator\n"
		"  Usage: wifescore [offset JSON file(s)...]\n"
		"  Prints the wife score (timing scale 1.0) of each file.\n";
}

void PrintError(smchart::ErrorType errorType)
{
	std::cerr << "Error: " << smchart::GetErrorString(errorType) << '\n';
}

bool DoScore(const char *szInputFilePath)
{
	std::cout << szInputFilePath << ": ";

	const smchart::OffsetJSONData offsetJSONData = smchart::LoadOffsetJSON(szInputFilePath);
	for (const std::string& warning : offsetJSONData.warnings)
	{
		std::cerr << "Warning: " << warning << '\n';
	}
	if (offsetJSONData.error != smchart::ErrorType::None)
	{
		PrintError(offsetJSONData.error);
		std::cout << std::endl;
		return false;
	}

	if (!smchart::HasScorableNotes(offsetJSONData.offsets))
	{
		std::cout << "no scorable notes" << std::endl;
		return true;
	}

	const double score = smchart::CalculateScore(offsetJSONData.offsets);
	std::cout << std::fixed << std::setprecision(2) << score * 100.0 << '%' << std::endl;
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
			if (!DoScore(argv[i]))
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
