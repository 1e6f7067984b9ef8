// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "RenameCommand.h"
#include <clarisma/cli/CliHelp.h>
#include <clarisma/cli/ConsoleWriter.h>

using namespace clarisma;

int RenameCommand::run(char* argv[])
{
	int res = SurveyCommand::run(argv);
	if (res != 0) return res;

	classify();
	std::vector<std::string> names = session_->rename(progress("Renaming..."));
	size_t failed = session_->renameFailures().size();

	if (Console::verbosity() >= Console::Verbosity::VERBOSE)
	{
		ConsoleWriter out;
		for (const std::string& name : names) out << name << "\n";
		out.flush();
	}
	Console::end().success() << static_cast<int64_t>(names.size()) << " photos named, "
		<< static_cast<int64_t>(failed) << " failed\n";
	return failed == 0 ? 0 : 1;
}

void RenameCommand::help()
{
	CliHelp help;
	help.command("vst rename <zones-file> <photo-dir> [<options>]",
		"Renames photos to \"NNN - SIGLA.ext\", numbered by capture time within each sigla. "
		"Photos that already carry such a name are left alone.");
	surveyOptions(help);
	generalOptions(help);
}
