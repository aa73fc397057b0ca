#ifndef CLI_H
#define CLI_H

#include <ostream>
#include <string>
#include <vector>
#include "options.h"

// otptool command line: results go to out, diagnostics to err.
// Exit status is 0 on success or match, 1 on no match, 2 on usage or input error.
class CLI {
public:
    static int run(int argc, char** argv, std::ostream& out, std::ostream& err);
    static int run(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err);

    // Longest code otptool accepts for --digits
    static const int MAX_DIGITS = 64;

private:
    static void usage(std::ostream& out);
    static std::vector<std::string> parseOptions(const std::vector<std::string>& argv, OtpOptions& options);
    static int runCommand(const std::vector<std::string>& args, const OtpOptions& options,
                          std::ostream& out, std::ostream& err);
};

#endif // CLI_H
