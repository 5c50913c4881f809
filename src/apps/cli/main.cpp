#include "Logging.hpp"
#include "consoleSession.hpp"
#include "options.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
	const std::string program = argc > 0 ? argv[0] : "notakto";
	const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

	std::string error;
	const auto options = notakto::cli::parseOptions(args, error);
	if (!options) {
		std::cerr << error << "\n" << notakto::cli::usage(program);
		return 1;
	}
	if (options->showHelp) {
		std::cout << notakto::cli::usage(program);
		return 0;
	}

	notakto::cli::ConsoleSession session(*options, std::cin, std::cout);
	session.run();

	notakto::cli::Logger().Log(Logging::LogLevel::Info, "[Cli] Session ended.");
	return 0;
}
