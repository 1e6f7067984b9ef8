// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ClassifyCommand.h"
#include <cstdio>
#include <clarisma/cli/CliHelp.h>
#include <clarisma/cli/ConsoleWriter.h>

using namespace clarisma;

int ClassifyCommand::run(char* argv[])
{
	int res = SurveyCommand::run(argv);
	if (res != 0) return res;

	classify();
	const std::vector<ClassifiedImage>& images = session_->images();
	Console::end().success() << "Classified " << static_cast<int64_t>(images.size()) << " images\n";

	ConsoleWriter out;
	char buf[64];
	for (const ClassifiedImage& image : images)
	{
		const Classification& c = image.classification;
		out << image.record.fileName() << "  " << Console::FAINT_LIGHT_BLUE
			<< zoneTypeName(c.type) << " " << c.zoneId << Console::DEFAULT
			<< "  " << c.sigla;
		if (!c.hasZone())
		{
			out << Console::BRIGHT_ORANGE << "  (no location)" << Console::DEFAULT;
		}
		else if (!c.isInside())
		{
			std::snprintf(buf, sizeof(buf), "  (%.6f away)", c.distance);
			out << Console::BRIGHT_ORANGE << buf << Console::DEFAULT;
		}
		out << "\n";
	}
	out.flush();
	return 0;
}

void ClassifyCommand::help()
{
	CliHelp help;
	help.command("vst classify <zones-file> <photo-dir> [<options>]",
		"Shows the zone and sigla each photo belongs to.");
	surveyOptions(help);
	generalOptions(help);
}
