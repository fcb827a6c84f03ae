#include <kapla/cli.hpp>
#include <kapla/commands.hpp>

int main(int argc, char** argv) {
    kapla::CliArgs args = kapla::cli_parse(argc, argv);
    return kapla::run_cli(args);
}
