#include "vaultphrases/derivation/recovery_kit.hpp"
#include "vaultphrases/derivation/vault_phrase_system.hpp"
#include "vaultphrases/crypto/scoped_wipe.hpp"
#include "vaultphrases/core/constants.hpp"

#include <termios.h>
#include <unistd.h>

#include <cstdio>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace vaultphrases;
using namespace vaultphrases::derivation;

namespace {

struct CliOptions {
    bool reveal = false;
    std::optional<std::string> label;
    int words = PhraseConstants::DEFAULT_WORD_COUNT;
    std::string delimiter = std::string(PhraseConstants::DEFAULT_DELIMITER);
    std::optional<std::string> wordlist;
    bool test_mode = false;
    bool recovery_kit = false;
    bool version = false;
    bool help = false;
};

void PrintUsage() {
    std::cout
        << "Usage: vaultphrases [options]\n"
        << "\n"
        << "Derive reproducible passphrases from a single root phrase.\n"
        << "\n"
        << "Options:\n"
        << "  --reveal            Show the HOT and COLD passphrases\n"
        << "  --label NAME        Derive a passphrase for a custom label\n"
        << "  --words N           Words per passphrase (default 6, max 128)\n"
        << "  --delimiter S       Word separator (default '-')\n"
        << "  --wordlist FILE     Wordlist file (required with --reveal or --label)\n"
        << "  --test              Weak Argon2id parameters; never for real secrets\n"
        << "  --recovery-kit      Print the recovery kit\n"
        << "  --version           Print version information\n"
        << "  -h, --help          Show this help\n";
}

CliOptions ParseOptions(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--reveal") {
            opts.reveal = true;
        } else if (arg == "--label") {
            if (++i >= argc) throw std::runtime_error("missing value for --label");
            opts.label = argv[i];
        } else if (arg == "--words") {
            if (++i >= argc) throw std::runtime_error("missing value for --words");
            size_t consumed = 0;
            opts.words = std::stoi(argv[i], &consumed);
            if (consumed != std::string_view(argv[i]).size()) {
                throw std::runtime_error("--words expects an integer");
            }
        } else if (arg == "--delimiter") {
            if (++i >= argc) throw std::runtime_error("missing value for --delimiter");
            opts.delimiter = argv[i];
        } else if (arg == "--wordlist") {
            if (++i >= argc) throw std::runtime_error("missing value for --wordlist");
            opts.wordlist = argv[i];
        } else if (arg == "--test") {
            opts.test_mode = true;
        } else if (arg == "--recovery-kit") {
            opts.recovery_kit = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            throw std::runtime_error("unknown option: " + arg);
        }
    }
    return opts;
}

bool IsStdinInteractive() {
    return isatty(fileno(stdin)) != 0;
}

void TrimTrailingNewlines(std::string& input) {
    while (!input.empty() && (input.back() == '\n' || input.back() == '\r')) {
        input.pop_back();
    }
}

/// Reads one line with terminal echo disabled when stdin is a terminal.
std::string PromptHidden(std::string_view prompt) {
    std::cerr << prompt;
    std::string line;
    termios original{};
    bool have_termios = false;
    if (IsStdinInteractive() && tcgetattr(STDIN_FILENO, &original) == 0) {
        have_termios = true;
        termios updated = original;
        updated.c_lflag &= static_cast<tcflag_t>(~ECHO);
        (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &updated);
    }
    const bool read_ok = static_cast<bool>(std::getline(std::cin, line));
    if (have_termios) {
        (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
        std::cerr << "\n";
    }
    if (!read_ok) {
        throw std::runtime_error("failed to read root phrase from stdin");
    }
    TrimTrailingNewlines(line);
    return line;
}

bool ConfirmTestMode() {
    std::cerr << "\nTEST MODE: weak Argon2id parameters, not for real secrets\n"
              << "Type 'test' to confirm: ";
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    TrimTrailingNewlines(answer);
    return answer == "test";
}

void WaitAndClearScreen() {
    std::cout << "\nPress ENTER to clear the screen..." << std::flush;
    std::string ignored;
    std::getline(std::cin, ignored);
    // Clear screen, clear scrollback, cursor home.
    std::cout << "\033[2J\033[3J\033[H" << std::flush;
}

void PrintVersion() {
    const auto scheme = configuration::SchemeConfig::Current();
    const auto params = scheme.KdfParameters(configuration::KdfMode::Production);
    std::cout << ToolInfo::NAME << " " << ToolInfo::VERSION << "\n"
              << "Scheme: " << scheme.VersionTag()
              << " | KDF: Argon2id (" << params.memory_cost_kib / 1024 << " MiB, "
              << params.time_cost << " iter) | HMAC-SHA256\n";
}

void PrintStrengthWarning(const phrase::PhraseStrength& strength) {
    if (strength.level != phrase::StrengthLevel::Weak) {
        return;
    }
    std::cerr << "\nWarning: weak root phrase detected\n";
    if (strength.word_count < StrengthConstants::WEAK_WORD_THRESHOLD) {
        std::cerr << "  -> " << strength.word_count << " words (recommend "
                  << StrengthConstants::STRONG_WORD_THRESHOLD << "+)\n";
    }
    if (strength.char_count < StrengthConstants::WEAK_CHAR_THRESHOLD) {
        std::cerr << "  -> " << strength.char_count << " chars (recommend "
                  << StrengthConstants::STRONG_CHAR_THRESHOLD << "+)\n";
    }
}

bool DerivesPhrases(const CliOptions& opts) {
    return opts.reveal || opts.label.has_value();
}

configuration::KdfMode ModeOf(const CliOptions& opts) {
    return opts.test_mode ? configuration::KdfMode::Test : configuration::KdfMode::Production;
}

int RunMasterOnly(const CliOptions& opts) {
    if (opts.test_mode) {
        std::cerr << "\nTEST MODE: weak Argon2id parameters, not for real secrets\n";
    }

    std::string root_phrase = PromptHidden("Enter your root phrase (input hidden): ");
    crypto::ScopedWipe root_guard(root_phrase);

    std::cerr << "Deriving master key..." << std::flush;
    auto strength_result = VaultPhraseSystem::CheckRootPhrase(
        root_phrase, ModeOf(opts), configuration::SchemeConfig::Current());
    if (strength_result.IsErr()) {
        std::cerr << "\nError: " << strength_result.UnwrapErr().message << "\n";
        return 1;
    }
    std::cerr << " done\n";
    PrintStrengthWarning(strength_result.Unwrap());

    std::cout << "\nMaster key derived\n"
              << "Use --reveal for HOT/COLD phrases, or --label NAME for custom\n";
    return 0;
}

int RunDerivation(const CliOptions& opts) {
    if (!opts.wordlist) {
        std::cerr << "Error: no wordlist specified, use --wordlist FILE\n";
        return 1;
    }
    if (opts.test_mode && !ConfirmTestMode()) {
        std::cerr << "Not confirmed. Remove --test for secure derivation.\n";
        return 1;
    }

    auto system_result = VaultPhraseSystem::Load(*opts.wordlist, configuration::SchemeConfig::Current());
    if (system_result.IsErr()) {
        std::cerr << "Error: " << system_result.UnwrapErr().message << "\n";
        return 1;
    }
    const auto& system = system_result.Unwrap();
    const auto& wordlist = system.GetWordlist();
    std::cout << "Wordlist: " << wordlist.SourceName() << " (" << wordlist.Size() << " words) ["
              << system.Fingerprint().ShortForm() << "]\n";

    const auto mode = ModeOf(opts);
    auto request = DerivationRequest::MasterOnly(mode);
    if (opts.reveal) {
        request = DerivationRequest::ReservedPair(mode, opts.words, opts.delimiter);
    }
    if (opts.label) {
        auto label_result = models::Label::Custom(*opts.label);
        if (label_result.IsErr()) {
            std::cerr << "Error: " << label_result.UnwrapErr().message << "\n";
            return 1;
        }
        request.Add(PhraseRequest{std::move(label_result).Unwrap(), opts.words, opts.delimiter});
    }

    std::string root_phrase = PromptHidden("Enter your root phrase (input hidden): ");
    crypto::ScopedWipe root_guard(root_phrase);

    std::cerr << "Deriving master key..." << std::flush;
    auto outcome_result = system.Derive(root_phrase, request);
    if (outcome_result.IsErr()) {
        std::cerr << "\nError: " << outcome_result.UnwrapErr().message << "\n";
        return 1;
    }
    std::cerr << " done\n";
    const auto& outcome = outcome_result.Unwrap();
    PrintStrengthWarning(outcome.strength);

    for (const auto& derived : outcome.phrases) {
        std::cout << "\n  " << derived.label_name << " (" << derived.scheme_version << ")\n"
                  << "  " << derived.passphrase.Joined() << "\n";
    }
    std::cout << "\n- Verify by running again with the same root phrase\n"
              << "- Close the terminal after copying\n";

    if (opts.recovery_kit) {
        std::cout << "\n" << RecoveryKit(system.Scheme(), opts.words, opts.delimiter)
            .WithWordlist(wordlist)
            .Render();
    }

    WaitAndClearScreen();
    return 0;
}

/// --recovery-kit without --reveal or --label: no root phrase is read.
int PrintStandaloneKit(const CliOptions& opts) {
    const auto scheme = configuration::SchemeConfig::Current();
    RecoveryKit kit(scheme, opts.words, opts.delimiter);
    if (!opts.wordlist) {
        std::cout << kit.Render();
        return 0;
    }
    auto wordlist_result = phrase::Wordlist::Load(*opts.wordlist);
    if (wordlist_result.IsErr()) {
        std::cerr << "Error: " << wordlist_result.UnwrapErr().message << "\n";
        return 1;
    }
    std::cout << kit.WithWordlist(wordlist_result.Unwrap()).Render();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto opts = ParseOptions(argc, argv);
        if (opts.help) {
            PrintUsage();
            return 0;
        }
        if (opts.version) {
            PrintVersion();
            return 0;
        }
        if (DerivesPhrases(opts)) {
            return RunDerivation(opts);
        }
        if (opts.recovery_kit) {
            return PrintStandaloneKit(opts);
        }
        return RunMasterOnly(opts);
    } catch (const std::exception& ex) {
        std::cerr << "vaultphrases: " << ex.what() << "\n";
        return 1;
    }
}
