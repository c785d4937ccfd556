#pragma once

namespace ferry::cli
{
	/** Entry point of the ferry command line; returns the process exit code */
	int run(int argc, char *argv[]);
}
