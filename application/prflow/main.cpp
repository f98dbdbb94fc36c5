#include <prflow/app.hpp>

int main(int argc, char **argv) { return prflow::App{}.run(argc, argv); }
