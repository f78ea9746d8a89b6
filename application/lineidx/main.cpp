#include <lineidx/app.hpp>

int main(int argc, char **argv) { return lineidx::App{}.run(argc, argv); }
