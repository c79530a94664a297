// pafclust entry point; commands register themselves with SubcommandRegistry
//
// Usage:
//   pafclust cluster -i hits.paf.gz -s 1,2,3 -o clusters.tsv   Build clusters

#include "subcommand.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    return pafclust::cli::SubcommandRegistry::instance().dispatch(argc, argv, std::cout,
                                                                  std::cerr);
}
