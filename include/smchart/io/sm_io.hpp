#pragma once
#include <istream>
#include "smchart/common/common.hpp"
#include "smchart/chart_data.hpp"

namespace smchart
{
	// Loads "#TITLE", "#OFFSET" and "#BPMS" only (note grids are not parsed)
	MetaChartData LoadSMMetaChartData(std::istream& stream);

	MetaChartData LoadSMMetaChartData(const std::string& filePath);

	ChartData LoadSMChartData(std::istream& stream);

	ChartData LoadSMChartData(const std::string& filePath);
}
