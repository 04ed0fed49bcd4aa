#include "include/riskscan_cli.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
	std::vector<std::string> args(argv + 1, argv + argc);
	return riskscan::RunCli(args, std::cout, std::cerr);
}
