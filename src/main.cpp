#include "cli.hpp"

int main(int argc, char* argv[]) {
    return vid2slides::run_cli(argc, argv);
}
