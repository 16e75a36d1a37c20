#include <iostream>

#include "run.hpp"

using namespace std;

int main(int argc, char* argv[]) {
    cout << unitbuf;
    cerr << unitbuf;

    return grep::run_command_line(argc, argv, cin, cout, cerr);
}
