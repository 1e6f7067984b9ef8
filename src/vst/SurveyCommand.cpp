// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "SurveyCommand.h"
#include <ctime>
#include <filesystem>
#include <clarisma/cli/CliHelp.h>
#include <clarisma/cli/ConsoleWriter.h>
#include <clarisma/io/FilePath.h>
#include <clarisma/validate/Validate.h>

using namespace clarisma;

SurveyCommand::Option SurveyCommand::SURVEY_OPTIONS[] =
{
	{ "cache",	OPTION_METHOD(&SurveyCommand::setCache) },
};

SurveyCommand::SurveyCommand() :
	cacheCapacity_(ThumbnailCache::DEFAULT_CAPACITY)
{
	addOptions(SURVEY_OPTIONS, sizeof(SURVEY_OPTIONS) / sizeof(Option));
}

bool SurveyCommand::setParam(int number, std::string_view value)
{
	switch (number)
	{
	case 0:
		return true;	// command itself
	case 1:
		zonesPath_ = FilePath::withDefaultExtension(value, ".geojson");
		return true;
	case 2:
		photoDir_ = value;
		return true;
	default:
		return false;
	}
}

int SurveyCommand::setCache(std::string_view value)
{
	if (!value.empty())
	{
		cacheCapacity_ = Validate::intValue(value.data(), 1, 1'000'000);
	}
	return 1;
}

int SurveyCommand::run(char* argv[])
{
	int res = BasicCommand::run(argv);
	if (res != 0) return res;

	if (zonesPath_.empty() || photoDir_.empty())
	{
		help();
		return 2;
	}
	std::error_code ec;
	if (!std::filesystem::is_directory(photoDir_, ec))
	{
		ConsoleWriter out;
		out.failed() << Console::FAINT_LIGHT_BLUE << photoDir_
			<< Console::DEFAULT << " is not a directory\n";
		return 2;
	}
	session_ = std::make_unique<InspectionSession>(photoDir_, cacheCapacity_);
	return 0;
}

void SurveyCommand::classify()
{
	session_->loadZones(zonesPath_.c_str());
	session_->classify(progress("Classifying..."));
}

std::string SurveyCommand::today()
{
	std::time_t now = std::time(nullptr);
	std::tm local{};
#ifdef _WIN32
	localtime_s(&local, &now);
#else
	localtime_r(&now, &local);
#endif
	char buf[16];
	std::strftime(buf, sizeof(buf), "%d/%m/%Y", &local);
	return buf;
}

void SurveyCommand::surveyOptions(CliHelp& help)
{
	help.beginSection("Arguments:");
	help.option("<zones-file>", "GeoJSON file with the Quadra/Canteiro polygons");
	help.option("<photo-dir>", "Directory with the inspection photos");
	help.endSection();
	help.beginSection("Scan Options:");
	help.option("--cache <n>", "Maximum number of thumbnails kept in memory (default: 512)");
	help.endSection();
}
