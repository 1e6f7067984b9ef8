// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <memory>
#include <string>
#include "BasicCommand.h"
#include "session/InspectionSession.h"

// Base of the commands that work on a zone dataset and a photo
// directory: `vst <command> <zones-file> <photo-dir> [<options>]`

class SurveyCommand : public BasicCommand
{
public:
	SurveyCommand();

	int run(char* argv[]);

protected:
	static Option SURVEY_OPTIONS[];

	bool setParam(int number, std::string_view value) override;
	int setCache(std::string_view value);
	virtual void help() {}
	void surveyOptions(clarisma::CliHelp& help);

	/// Loads the zones, then scans and classifies the photos
	void classify();

	/// Today's date as dd/mm/YYYY
	static std::string today();

	std::string zonesPath_;
	std::string photoDir_;
	size_t cacheCapacity_;
	std::unique_ptr<InspectionSession> session_;
};
