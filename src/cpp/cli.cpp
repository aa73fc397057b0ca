#include "../h/cli.h"
#include "../h/exceptions.h"
#include "../h/hotp.h"
#include "../h/totp.h"
#include "../h/version.h"
#include <cstdint>
#include <limits>

static const uint64_t MAX_U64 = std::numeric_limits<uint64_t>::max();

void CLI::usage(std::ostream& out) {
    out << "usage: otptool [options] hotp SECRET COUNTER\n"
        << "       otptool [options] totp SECRET [CLOCK]\n"
        << "       otptool [options] check-hotp CODE SECRET [LAST]\n"
        << "       otptool [options] check-totp CODE SECRET [CLOCK]\n\n"
        << "options:\n"
        << "  --digits N      code length, 1 to " << MAX_DIGITS << " (default 6)\n"
        << "  --interval N    TOTP step in seconds (default 30)\n"
        << "  --digest NAME   HMAC digest, e.g. SHA1, SHA256, SHA512 (default SHA1)\n"
        << "  --trials N      HOTP counters checked after LAST (default 1000)\n"
        << "  --window N      TOTP steps accepted around CLOCK (default 0)\n"
        << "  --no-casefold   reject lowercase secrets\n"
        << "  --version       print version and exit\n";
}

// Parses options into the given structure, returns the remaining arguments
std::vector<std::string> CLI::parseOptions(const std::vector<std::string>& argv, OtpOptions& options) {
    std::vector<std::string> args;
    for (size_t i = 1; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        bool has_value = i + 1 < argv.size();

        if (arg == "--no-casefold") {
            options.casefold = false;
        } else if (arg == "--digits" && has_value) {
            options.digits = static_cast<int>(Exceptions::getValidNumber(argv[++i], 1, MAX_DIGITS, "digits"));
        } else if (arg == "--interval" && has_value) {
            options.interval = Exceptions::getValidNumber(argv[++i], 1, MAX_U64, "interval");
        } else if (arg == "--digest" && has_value) {
            options.digest = Digest::byName(argv[++i]);
        } else if (arg == "--trials" && has_value) {
            options.trials = Exceptions::getValidNumber(argv[++i], 1, MAX_U64, "trials");
        } else if (arg == "--window" && has_value) {
            options.window = Exceptions::getValidNumber(argv[++i], 0, MAX_U64, "window");
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0 && arg != "--version" && arg != "--help") {
            throw std::invalid_argument("Unknown or incomplete option: " + arg);
        } else {
            args.push_back(arg);
        }
    }
    return args;
}

int CLI::runCommand(const std::vector<std::string>& args, const OtpOptions& options,
                    std::ostream& out, std::ostream& err) {
    const std::string& command = args[0];

    if (command == "hotp" && args.size() == 3) {
        uint64_t counter = Exceptions::getValidNumber(args[2], 0, MAX_U64, "counter");
        out << HOTP::generateCodeString(args[1], counter, options) << std::endl;
        return 0;
    }

    if (command == "totp" && (args.size() == 2 || args.size() == 3)) {
        uint64_t clock = args.size() == 3 ? Exceptions::getValidNumber(args[2], 0, MAX_U64, "clock") : TOTP::now();
        out << TOTP::generateCodeString(args[1], clock, options) << std::endl;
        return 0;
    }

    if (command == "check-hotp" && (args.size() == 3 || args.size() == 4)) {
        uint64_t last = args.size() == 4 ? Exceptions::getValidNumber(args[3], 0, MAX_U64, "last") : 1;
        uint64_t counter = 0;
        if (HOTP::verifyCode(args[1], args[2], last, options, counter)) {
            out << counter << std::endl;
            return 0;
        }
        err << "HOTP: code does not match any counter after " << last << std::endl;
        return 1;
    }

    if (command == "check-totp" && (args.size() == 3 || args.size() == 4)) {
        uint64_t clock = args.size() == 4 ? Exceptions::getValidNumber(args[3], 0, MAX_U64, "clock") : TOTP::now();
        if (TOTP::verifyCode(args[1], args[2], clock, options)) {
            out << "valid" << std::endl;
            return 0;
        }
        err << "TOTP: code does not match" << std::endl;
        return 1;
    }

    usage(err);
    return 2;
}

int CLI::run(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err) {
    try {
        OtpOptions options;
        std::vector<std::string> args = parseOptions(argv, options);

        if (args.size() == 1 && args[0] == "--version") {
            out << "otptool " << ONETIMEPASS_VERSION << std::endl;
            return 0;
        }
        if (args.empty() || args[0] == "--help" || args[0] == "-h") {
            usage(args.empty() ? err : out);
            return args.empty() ? 2 : 0;
        }

        return runCommand(args, options, out, err);
    } catch (const InvalidSecret& e) {
        err << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        err << "Fatal error: " << e.what() << std::endl;
        return 2;
    }
}

int CLI::run(int argc, char** argv, std::ostream& out, std::ostream& err) {
    return run(std::vector<std::string>(argv, argv + argc), out, err);
}
