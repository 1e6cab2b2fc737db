// SPDX-License-Identifier: Apache-2.0
#include "VerusStrip.hpp"

int main(int argc, char** argv) {
    VerusStrip verusStrip;
    verusStrip.addArgs();

    verusStrip.parseArgs(argc, argv);

    return verusStrip.run();
}
