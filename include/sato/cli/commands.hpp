#pragma once

namespace sato::cli {

int run_cli(int argc, char **argv);

} // namespace sato::cli
