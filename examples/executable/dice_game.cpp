#include <cstdlib>
#include <iostream>
#include <vector>
#include "dice.h"

// usage: dice_game ndice sides seed
// prints the metrics (sum, sd) of one game on standard out
int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "\n\tUsage: ./dice_game ndice sides seed\n\n";
        std::cout << "ERROR";
        return 100;
    }
    const size_t ndice = static_cast<size_t>(atof(argv[1]));
    const size_t sides = static_cast<size_t>(atof(argv[2]));
    const unsigned long int seed = strtoul(argv[3], nullptr, 10);
    if (ndice == 0 or sides == 0) {
        std::cout << "ERROR";
        return 101;
    }

    const std::vector<double> metrics = dice::fair(ndice, sides, seed);
    std::cout << metrics[0] << " " << metrics[1] << std::endl;
    return 0;
}
