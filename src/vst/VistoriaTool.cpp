// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "VistoriaTool.h"
#include <string_view>
#include <clarisma/cli/Console.h>
#include <clarisma/cli/ConsoleWriter.h>
#include "ClassifyCommand.h"
#include "DefaultCommand.h"
#include "InitCommand.h"
#include "RenameCommand.h"
#include "ReportCommand.h"

using namespace clarisma;

int VistoriaTool::classify(char* argv[])
{
	ClassifyCommand cmd;
	return cmd.run(argv);
}

int VistoriaTool::init(char* argv[])
{
	InitCommand cmd;
	return cmd.run(argv);
}

int VistoriaTool::rename(char* argv[])
{
	RenameCommand cmd;
	return cmd.run(argv);
}

int VistoriaTool::report(char* argv[])
{
	ReportCommand cmd;
	return cmd.run(argv);
}

int VistoriaTool::run(char* argv[])
{
	char** args = argv + 1;
	std::string_view command = args[0] ? args[0] : "";
	try
	{
		if (command == "classify") return classify(args);
		if (command == "init") return init(args);
		if (command == "rename") return rename(args);
		if (command == "report") return report(args);
		DefaultCommand cmd;
		return cmd.run(args);
	}
	catch (const std::exception& ex)
	{
		// ZoneException, PdfException, IOException and parse errors
		Console::end().failed() << ex.what() << "\n";
	}
	return 1;
}
