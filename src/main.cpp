#include "options.h"

int main(int argc,char**argv) {
    return sqfree::run_cli(argc,argv);
}
