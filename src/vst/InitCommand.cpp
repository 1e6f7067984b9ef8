// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "InitCommand.h"
#include <clarisma/cli/CliHelp.h>
#include <clarisma/cli/ConsoleWriter.h>
#include "report/EditStore.h"

using namespace clarisma;

int InitCommand::run(char* argv[])
{
	int res = SurveyCommand::run(argv);
	if (res != 0) return res;

	classify();
	std::filesystem::path storePath = session_->editStorePath();
	EditStore store = EditStore::load(storePath);
	int added = 0;
	for (const ClassifiedImage& image : session_->images())
	{
		const std::string& hash = image.record.contentHash;
		if (store.contains(hash)) continue;
		store.edit(hash);
		added++;
	}
	if (store.reportDate().empty()) store.setReportDate(today());
	store.save(storePath);

	Console::end().success() << "Added " << added << " photos to "
		<< Console::FAINT_LIGHT_BLUE << EditStore::FILE_NAME
		<< Console::DEFAULT << " (" << static_cast<int64_t>(store.size()) << " in total)\n";
	return 0;
}

void InitCommand::help()
{
	CliHelp help;
	help.command("vst init <zones-file> <photo-dir> [<options>]",
		"Creates the edit store of a photo directory, or adds new photos to it. "
		"Existing comments, states and order are kept.");
	surveyOptions(help);
	generalOptions(help);
}
