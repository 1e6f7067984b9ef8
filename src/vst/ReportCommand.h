// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <optional>
#include <clarisma/io/FilePath.h>
#include "SurveyCommand.h"

class ReportCommand : public SurveyCommand
{
public:
	ReportCommand();

	int run(char* argv[]);

private:
	static Option REPORT_OPTIONS[];

	void help() override;

	int setOutput(std::string_view value)
	{
		outputPath_ = clarisma::FilePath::withDefaultExtension(value, ".pdf");
		return 1;
	}

	int setConfig(std::string_view value)
	{
		configPath_ = value;
		return 1;
	}

	int setStore(std::string_view value)
	{
		storePath_ = value;
		return 1;
	}

	int setDate(std::string_view value)
	{
		reportDate_ = value;
		return 1;
	}

	int setSignature(std::string_view)
	{
		signature_ = true;
		return 0;
	}

	int setNoStates(std::string_view)
	{
		noStates_ = true;
		return 0;
	}

	int setNoCommentsTable(std::string_view)
	{
		noCommentsTable_ = true;
		return 0;
	}

	int setRename(std::string_view)
	{
		rename_ = true;
		return 0;
	}

	bool loadSettings(ReportSettings& settings);
	std::string defaultOutputPath(const std::string& reportDate) const;

	std::string outputPath_;
	std::string configPath_;
	std::string storePath_;
	std::optional<std::string> reportDate_;
	bool signature_ = false;
	bool noStates_ = false;
	bool noCommentsTable_ = false;
	bool rename_ = false;
};
