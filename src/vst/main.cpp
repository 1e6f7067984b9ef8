// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "VistoriaTool.h"

int main(int argc, char* argv[])
{
	VistoriaTool app;
	return app.run(argv);
}
