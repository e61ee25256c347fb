// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file main.cc
 * @brief authkeep command-line tool
 *
 * Usage: authkeep [--config FILE] [--store FILE] COMMAND [ARGS]
 *
 * Passphrases are read from AUTHKEEP_PASSPHRASE, never from argv, so they
 * do not show up in process listings or shell history.
 */

#include "config.h"
#include "core/AuthRuntime.h"
#include "core/config/AuthConfig.h"
#include "utils/Log.h"
#include "utils/SecureMemory.h"

#include <glibmm/init.h>
#include <glibmm/optioncontext.h>
#include <glibmm/optionentry.h>
#include <glibmm/optiongroup.h>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace AuthKeep;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAIL = 1;

constexpr const char* USAGE =
    "COMMAND [ARGS]\n"
    "\n"
    "Commands:\n"
    "  check-config                 Validate configuration and KDF setup\n"
    "  encrypt                      Encrypt stdin with AUTHKEEP_PASSPHRASE\n"
    "  decrypt                      Decrypt a blob read from stdin\n"
    "  hash-passphrase              Hash AUTHKEEP_PASSPHRASE for storage\n"
    "  verify-passphrase HASH       Check AUTHKEEP_PASSPHRASE against HASH\n"
    "  initiate IDENTIFIER          Start OTP sign-in\n"
    "  verify SESSION-ID CODE       Complete OTP sign-in\n"
    "  sweep                        Purge expired sessions, counters and challenges";

/**
 * @brief FIDO2 verifier for builds without one
 *
 * The CLI has no WebAuthn commands; anything reaching this rejects.
 */
class RejectingAssertionVerifier final : public IAssertionVerifier {
public:
    [[nodiscard]] AuthResult<VerifiedAssertion> verify(const AssertionResponse&,
                                                       const AssertionExpectation&) const override {
        Log::error("No FIDO2 assertion verifier is configured");
        return std::unexpected(AuthError::AssertionInvalid);
    }
};

std::optional<SecureString> passphrase_from_env() {
    const char* value = std::getenv("AUTHKEEP_PASSPHRASE");
    if (!value || !*value) {
        std::cerr << "AUTHKEEP_PASSPHRASE is not set\n";
        return std::nullopt;
    }
    return SecureString{std::string(value)};
}

SecureVector<uint8_t> read_stdin() {
    SecureVector<uint8_t> data;
    std::istreambuf_iterator<char> it(std::cin), end;
    for (; it != end; ++it) {
        data.push_back(static_cast<uint8_t>(*it));
    }
    return data;
}

int report_failure(const AuthFailure& failure) {
    std::cerr << std::format("error: {} ({})", failure.message(), error_code(failure.code));
    if (failure.retry_after.count() > 0) {
        std::cerr << std::format(", retry after {}s", failure.retry_after.count());
    }
    if (failure.attempts_remaining) {
        std::cerr << std::format(", {} attempts remaining", *failure.attempts_remaining);
    }
    std::cerr << '\n';
    return EXIT_FAIL;
}

int report_error(AuthError error) {
    return report_failure(make_failure(error));
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check_config(AuthRuntime& runtime) {
    const auto& config = runtime.config();
    auto backend = runtime.kdf_provider().preferred();
    if (!backend) {
        return report_error(backend.error());
    }

    std::cout << std::format("environment:      {}\n", to_string(config.environment));
    std::cout << std::format("kdf backend:      {}{}\n", to_string((*backend)->algorithm()),
                             runtime.kdf_provider().fips_enabled() ? " (FIPS)" : "");
    std::cout << std::format("argon2:           m=2^{} KiB, t={}\n",
                             config.kdf_params.argon2_memory_cost_log2, config.kdf_params.argon2_time_cost);
    std::cout << std::format("otp ttl:          {} min\n", config.otp_ttl.count());
    std::cout << std::format("session ttl:      {} min\n", config.session_ttl.count());
    std::cout << std::format("store:            {}\n",
                             config.store_path.empty() ? "in-memory" : config.store_path.string());
    std::cout << std::format("webauthn rp-id:   {}\n", config.webauthn.rp_id);
    return EXIT_OK;
}

int cmd_encrypt(AuthRuntime& runtime) {
    auto passphrase = passphrase_from_env();
    if (!passphrase) {
        return EXIT_FAIL;
    }
    const auto plaintext = read_stdin();
    auto blob = runtime.cipher().encrypt(std::span<const uint8_t>(plaintext), passphrase->view());
    if (!blob) {
        return report_error(blob.error());
    }
    std::cout << blob->serialize() << '\n';
    return EXIT_OK;
}

int cmd_decrypt(AuthRuntime& runtime) {
    auto passphrase = passphrase_from_env();
    if (!passphrase) {
        return EXIT_FAIL;
    }
    const auto input = read_stdin();
    std::string serialized(input.begin(), input.end());
    while (!serialized.empty() && (serialized.back() == '\n' || serialized.back() == '\r' ||
                                   serialized.back() == ' ')) {
        serialized.pop_back();
    }

    auto plaintext = runtime.cipher().decrypt(std::string_view(serialized), passphrase->view());
    if (!plaintext) {
        return report_error(plaintext.error());
    }
    std::cout.write(reinterpret_cast<const char*>(plaintext->data()),
                    static_cast<std::streamsize>(plaintext->size()));
    std::cout.flush();
    return EXIT_OK;
}

int cmd_hash_passphrase(AuthRuntime& runtime) {
    auto passphrase = passphrase_from_env();
    if (!passphrase) {
        return EXIT_FAIL;
    }
    auto hash = runtime.cipher().hash_passphrase(passphrase->view());
    if (!hash) {
        return report_error(hash.error());
    }
    std::cout << *hash << '\n';
    return EXIT_OK;
}

int cmd_verify_passphrase(AuthRuntime& runtime, const std::string& stored_hash) {
    auto passphrase = passphrase_from_env();
    if (!passphrase) {
        return EXIT_FAIL;
    }
    const bool valid = runtime.cipher().verify_passphrase(passphrase->view(), stored_hash);
    std::cout << (valid ? "valid" : "invalid") << '\n';
    return valid ? EXIT_OK : EXIT_FAIL;
}

int cmd_initiate(AuthRuntime& runtime, const std::string& identifier) {
    ClientMeta meta;
    meta.user_agent = std::format("authkeep-cli/{}", VERSION);
    auto response = runtime.auth().initiate(identifier, meta);
    if (!response) {
        return report_failure(response.error());
    }
    std::cout << std::format("session-id: {}\n", response->session_id);
    std::cout << std::format("expires-in: {}s\n", response->expires_in_seconds);
    std::cout << std::format("delivered:  {}\n", response->delivered ? "yes" : "no");
    if (response->code) {
        std::cout << std::format("code:       {}\n", *response->code);
    }
    return EXIT_OK;
}

int cmd_verify(AuthRuntime& runtime, const std::string& session_id, const std::string& code) {
    ClientMeta meta;
    meta.user_agent = std::format("authkeep-cli/{}", VERSION);
    auto response = runtime.auth().verify(session_id, code, meta);
    if (!response) {
        return report_failure(response.error());
    }
    if (!response->success) {
        std::cout << std::format("invalid code, {} attempts remaining\n", response->attempts_remaining);
        return EXIT_FAIL;
    }
    std::cout << std::format("verified\nsession-token: {}\n", *response->session_token);
    return EXIT_OK;
}

int cmd_sweep(AuthRuntime& runtime) {
    auto report = runtime.auth().sweep_expired();
    if (!report) {
        return report_failure(report.error());
    }
    std::cout << std::format("otp sessions:        {}\n", report->otp_sessions);
    std::cout << std::format("rate-limit counters: {}\n", report->rate_limit_counters);
    std::cout << std::format("webauthn challenges: {}\n", report->webauthn_challenges);
    std::cout << std::format("auth sessions:       {}\n", report->auth_sessions);
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    Glib::init();

    std::string config_path;
    std::string store_path;
    bool show_version = false;

    Glib::OptionContext context(USAGE);
    Glib::OptionGroup group("authkeep", "AuthKeep options", "Show AuthKeep options");

    Glib::OptionEntry config_entry;
    config_entry.set_long_name("config");
    config_entry.set_short_name('c');
    config_entry.set_description("Configuration file");
    config_entry.set_arg_description("FILE");
    group.add_entry_filename(config_entry, config_path);

    Glib::OptionEntry store_entry;
    store_entry.set_long_name("store");
    store_entry.set_short_name('s');
    store_entry.set_description("Store file (overrides service.store-path)");
    store_entry.set_arg_description("FILE");
    group.add_entry_filename(store_entry, store_path);

    Glib::OptionEntry version_entry;
    version_entry.set_long_name("version");
    version_entry.set_description("Print version and exit");
    group.add_entry(version_entry, show_version);

    context.set_main_group(group);

    try {
        if (!context.parse(argc, argv)) {
            return EXIT_FAIL;
        }
    } catch (const Glib::Error& e) {
        std::cerr << e.what() << '\n';
        return EXIT_FAIL;
    }

    if (show_version) {
        std::cout << PROJECT_NAME << ' ' << VERSION << '\n';
        return EXIT_OK;
    }

    const std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        std::cerr << context.get_help();
        return EXIT_FAIL;
    }
    const std::string& command = args[0];

    // Configuration: explicit file, else the default if present, else built-in defaults
    AuthResult<AuthConfig> config = AuthConfig{};
    if (!config_path.empty()) {
        config = AuthConfig::load(config_path);
    } else if (std::error_code ec; std::filesystem::exists(AUTHKEEP_DEFAULT_CONFIG_PATH, ec)) {
        config = AuthConfig::load(AUTHKEEP_DEFAULT_CONFIG_PATH);
    } else if (auto overridden = config->apply_environment_overrides(); !overridden) {
        return report_error(overridden.error());
    }
    if (!config) {
        return report_error(config.error());
    }
    if (!store_path.empty()) {
        config->store_path = store_path;
    }

    Log::set_level(config->log_level);
    RejectingAssertionVerifier verifier;
    auto runtime = AuthRuntime::create(*config, &verifier);
    if (!runtime) {
        return report_error(runtime.error());
    }
    auto& rt = **runtime;

    if (command == "check-config" && args.size() == 1) {
        return cmd_check_config(rt);
    }
    if (command == "encrypt" && args.size() == 1) {
        return cmd_encrypt(rt);
    }
    if (command == "decrypt" && args.size() == 1) {
        return cmd_decrypt(rt);
    }
    if (command == "hash-passphrase" && args.size() == 1) {
        return cmd_hash_passphrase(rt);
    }
    if (command == "verify-passphrase" && args.size() == 2) {
        return cmd_verify_passphrase(rt, args[1]);
    }
    if (command == "initiate" && args.size() == 2) {
        return cmd_initiate(rt, args[1]);
    }
    if (command == "verify" && args.size() == 3) {
        return cmd_verify(rt, args[1], args[2]);
    }
    if (command == "sweep" && args.size() == 1) {
        return cmd_sweep(rt);
    }

    std::cerr << context.get_help();
    return EXIT_FAIL;
}
