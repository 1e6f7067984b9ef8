// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ReportCommand.h"
#include <clarisma/cli/CliHelp.h>
#include <clarisma/cli/ConsoleWriter.h>
#include <clarisma/io/File.h>
#include <clarisma/io/IOException.h>
#include "report/EditStore.h"

using namespace clarisma;

ReportCommand::Option ReportCommand::REPORT_OPTIONS[] =
{
	{ "o",					OPTION_METHOD(&ReportCommand::setOutput) },
	{ "output",				OPTION_METHOD(&ReportCommand::setOutput) },
	{ "c",					OPTION_METHOD(&ReportCommand::setConfig) },
	{ "config",				OPTION_METHOD(&ReportCommand::setConfig) },
	{ "store",				OPTION_METHOD(&ReportCommand::setStore) },
	{ "date",				OPTION_METHOD(&ReportCommand::setDate) },
	{ "S",					OPTION_METHOD(&ReportCommand::setSignature) },
	{ "signature",			OPTION_METHOD(&ReportCommand::setSignature) },
	{ "no-states",			OPTION_METHOD(&ReportCommand::setNoStates) },
	{ "no-comments-table",	OPTION_METHOD(&ReportCommand::setNoCommentsTable) },
	{ "rename",				OPTION_METHOD(&ReportCommand::setRename) },
};

ReportCommand::ReportCommand()
{
	addOptions(REPORT_OPTIONS, sizeof(REPORT_OPTIONS) / sizeof(Option));
}

bool ReportCommand::loadSettings(ReportSettings& settings)
{
	std::string path = configPath_;
	if (path.empty())
	{
		if (!File::exists(ReportSettings::FILE_NAME)) return true;
		path = ReportSettings::FILE_NAME;
	}
	try
	{
		settings.load(path.c_str());
		Console::log("Loaded report settings from %s", path.c_str());
		return true;
	}
	catch (const IOException& ex)
	{
		ConsoleWriter out;
		out.failed() << "Cannot read " << Console::FAINT_LIGHT_BLUE << path
			<< Console::DEFAULT << ": " << ex.what() << "\n";
	}
	catch (const std::exception& ex)
	{
		ConsoleWriter out;
		out.failed() << Console::FAINT_LIGHT_BLUE << path
			<< Console::DEFAULT << ": " << ex.what() << "\n";
	}
	return false;
}

// <yyMMdd>_Relatorio.pdf in the photo directory, dated by the report
// date (dd/mm/YYYY)
std::string ReportCommand::defaultOutputPath(const std::string& reportDate) const
{
	std::string date = reportDate.size() == 10 ? reportDate : today();
	std::string name;
	name.reserve(20);
	name.append(date, 8, 2);
	name.append(date, 3, 2);
	name.append(date, 0, 2);
	name.append("_Relatorio.pdf");
	return (std::filesystem::path(photoDir_) / name).string();
}

int ReportCommand::run(char* argv[])
{
	int res = SurveyCommand::run(argv);
	if (res != 0) return res;

	ReportSettings settings;
	if (!loadSettings(settings)) return 2;

	std::filesystem::path storePath = storePath_.empty() ?
		session_->editStorePath() : std::filesystem::path(storePath_);
	EditStore edits = EditStore::load(storePath);

	ReportOptions options;
	options.reportDate = reportDate_ ? *reportDate_ : edits.reportDate();
	if (options.reportDate.empty()) options.reportDate = today();
	options.generalComments = edits.generalComments();
	options.disableStates = noStates_ || edits.disableStates();
	options.disableCommentsTable = noCommentsTable_ || edits.disableCommentsTable();
	options.includeSignature = signature_;

	if (outputPath_.empty()) outputPath_ = defaultOutputPath(options.reportDate);
	if (!confirmReplace(outputPath_)) return 0;

	classify();
	if (rename_)
	{
		session_->rename(progress("Renaming..."));
		size_t failed = session_->renameFailures().size();
		if (failed)
		{
			Console::msg("%d photos could not be renamed", static_cast<int>(failed));
		}
	}

	Console::get()->start("Rendering...");
	PagePlan plan = session_->report(outputPath_.c_str(), settings, options, edits);
	Console::end().success() << "Wrote " << Console::FAINT_LIGHT_BLUE
		<< outputPath_ << Console::DEFAULT << " (" << plan.totalPages
		<< " pages, " << static_cast<int64_t>(session_->entryCount()) << " photos)\n";
	return 0;
}

void ReportCommand::help()
{
	CliHelp help;
	help.command("vst report <zones-file> <photo-dir> [<options>]",
		"Creates the PDF inspection report of a photo directory.");
	surveyOptions(help);
	help.beginSection("Report Options:");
	help.option("-o, --output <file>", "Output file (default: <photo-dir>/<yyMMdd>_Relatorio.pdf)");
	help.option("-c, --config <file>", "Report settings (default: Report_config.json if present)");
	help.option("--store <file>", "Edit store (default: <photo-dir>/imagens_db.json)");
	help.option("--date <dd/mm/yyyy>", "Report date");
	help.option("-S, --signature", "Add the signature page");
	help.option("--no-states", "Leave out states and the status tables");
	help.option("--no-comments-table", "Leave out the comment tables");
	help.option("--rename", "Give photos their canonical names first");
	help.endSection();
	generalOptions(help);
}
