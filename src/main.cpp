#include <iostream>
#include <string>
#include "git_nonce.hpp"

int main(int argc, char* argv[])
{
    GitNonceOptions opts;
    if (int rc = parseGitNonceArgs(argc, argv, opts, std::cerr)) {
        return rc;
    }

    std::string error;
    if (!validateConfig(opts.search, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    GitRepository repo;
    if (!repo.open(opts.repo, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    std::string reflogMessage;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) reflogMessage += " ";
        reflogMessage += argv[i];
    }

    return runGitNonce(repo, opts, reflogMessage, std::cout, std::cerr);
}
