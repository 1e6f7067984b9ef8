// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <clarisma/cli/CliCommand.h>
#include <clarisma/cli/Console.h>
#include <clarisma/cli/VerbosityLevel.h>
#include "util/Progress.h"

namespace clarisma {
class CliHelp;
}

#define OPTION_METHOD(m) static_cast<OptionMethodPtr>(m)

using clarisma::Console;

// Options and console helpers shared by all vst commands

class BasicCommand : clarisma::CliCommand
{
public:
	BasicCommand();

	int run(char* argv[]);

protected:
	using OptionMethodPtr = int (BasicCommand::*)(std::string_view);
	struct Option
	{
		std::string_view name;
		OptionMethodPtr method;
	};

	static Option BASIC_OPTIONS[];

	void addOptions(const Option* options, size_t count);
	int setOption(std::string_view name, std::string_view value) override;

	int setYesToAllPrompts(std::string_view)
	{
		yesToAllPrompts_ = true;
		return 0;
	}

	int setNoColor(std::string_view)	// NOLINT: option setter cannot be static
	{
		Console::get()->enableColor(false);
		return 0;
	}

	int setVerbosity(std::string_view name);

	/// Asks before an existing file is replaced (unless -Y was given).
	/// Returns true if the file may be written.
	bool confirmReplace(const std::string& path) const;

	/// Starts a console task and returns a callback that advances its
	/// progress bar
	static ProgressCallback progress(const char* task);

	void generalOptions(clarisma::CliHelp& help);

	bool yesToAllPrompts_;
	std::unordered_map<std::string_view,OptionMethodPtr> options_;
};
