#include "cloak/cloak_common.hpp"
#include "cloak/config.hpp"
#include "cloak/env_secret.hpp"
#include "cloak/hasher.hpp"
#include "cloak/logging.hpp"
#include "cloak/secret.hpp"
#include "cloak/sys_env.hpp"
#include "cloak/util.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

using namespace cloak;

// exit codes
static constexpr int EXIT_OK = 0;
static constexpr int EXIT_USAGE = 1;
static constexpr int EXIT_NO_SECRET = 2;
static constexpr int EXIT_CRYPTO = 3;

static void print_usage(std::ostream& os, const char* argv0) {
    os << "Usage: " << argv0 << " [--env NAME] [--hasher sha256|blake2b] [--help]\n"
        << "\n"
        << "Prints the opaque tag of a secret without echoing it.\n"
        << "  --env NAME      read the secret from environment variable NAME\n"
        << "                  (default: prompt on the terminal)\n"
        << "  --hasher ALGO   tag algorithm, sha256 (default) or blake2b\n"
        << "  --help          show this message\n";
}

struct Options {
    std::string env_name;
    std::string hasher = "sha256";
    bool help = false;
};

// ---------------- argument parsing ----------------
static bool parse_args(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        }
        else if (arg == "--env" && i + 1 < argc) {
            opts.env_name = argv[++i];
        }
        else if (arg == "--hasher" && i + 1 < argc) {
            opts.hasher = argv[++i];
        }
        else {
            return false;
        }
    }
    return true;
}

// ---------------- secret acquisition ----------------
static std::optional<OneShotSecret<std::string>> read_secret(const Options& opts) {
    if (!opts.env_name.empty()) {
        return secret_from_env<OneShotSecret<std::string>>(opts.env_name);
    }

    SecureBuffer pw = get_password_secure("Secret: ");
    if (pw.size() == 0) {
        return std::nullopt;
    }
    std::string value(reinterpret_cast<const char*>(pw.data()), pw.size());
    pw.wipe();
    return std::optional<OneShotSecret<std::string>>(std::in_place, std::move(value));
}

// -----------------------------------------------------------------------
// main
// -----------------------------------------------------------------------
int main(int argc, char** argv) {
    ProcessEnv env;
    set_config(load_config(env));

    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(std::cerr, argv[0]);
        return EXIT_USAGE;
    }
    if (opts.help) {
        print_usage(std::cout, argv[0]);
        return EXIT_OK;
    }

    const Hasher* hasher = find_hasher(opts.hasher);
    if (!hasher) {
        std::cerr << "Unknown hasher: " << opts.hasher << "\n";
        print_usage(std::cerr, argv[0]);
        return EXIT_USAGE;
    }

    try {
        ensure_sodium_ready();
        init_log_context();
    }
    catch (const std::runtime_error& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << "\n";
        return EXIT_CRYPTO;
    }

    audit_log_level(LogLevel::INFO,
        "cloak-tag starting",
        "session",
        "notify");

    std::optional<OneShotSecret<std::string>> secret;
    try {
        secret = read_secret(opts);
    }
    catch (const std::runtime_error& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << "\n";
        return EXIT_CRYPTO;
    }

    if (!secret) {
        audit_log_level(LogLevel::WARN,
            "No secret supplied",
            "cloak_tag",
            "failure");
        std::cerr << "No secret supplied.\n";
        return EXIT_NO_SECRET;
    }

    // One read: tag the value, then the secret destroys itself
    std::optional<Result<std::string>> tag;
    try {
        tag.emplace(secret->use([hasher](const std::string& v) {
            return hasher->hash(v);
        }));
    }
    catch (const std::runtime_error& e) {
        audit_log_level(LogLevel::ERROR,
            std::string("Tagging failed: ") + e.what(),
            "cloak_tag",
            "failure");
        std::cerr << "An unexpected error occurred: " << e.what() << "\n";
        return EXIT_CRYPTO;
    }
    if (!tag->ok()) {
        std::cerr << tag->error().what() << "\n";
        return EXIT_NO_SECRET;
    }

    std::cout << hasher->name() << ":" << tag->value() << "\n";

    audit_log_level(LogLevel::INFO,
        "Tag emitted",
        "cloak_tag",
        "success");
    return EXIT_OK;
}
