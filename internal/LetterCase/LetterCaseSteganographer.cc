#include "LetterCaseSteganographer.hh"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace Bacon
{
    std::optional<BaconError> LetterCaseSteganographer::validate_secret(const std::string& secret,
                                                                        const std::string& public_text,
                                                                        std::size_t group_size) const
    {
        const bool invalid = std::any_of(secret.begin(), secret.end(),
                                         [](char c) { return !is_alphabetic(c) && c != ' '; });
        if (invalid) {
            std::cerr << BACON_CLI_RED << "LetterCaseSteganographer::disguise(): secret contains non alphabetic characters"
                      << BACON_CLI_RESET << std::endl;
            return BaconError::steganographer(
                "The secret can contain only alphabetic characters. This is an invalid secret");
        }

        const std::size_t available = count_alphabetic(public_text);
        const std::size_t required = count_alphabetic(secret) * group_size;
        if (available < required) {
            std::cerr << BACON_CLI_RED << "LetterCaseSteganographer::disguise(): insufficient capacity (needed "
                      << required << " letters, available " << available << ")." << BACON_CLI_RESET << std::endl;
            return BaconError::steganographer("The public input should have at least size " + std::to_string(required)
                                              + ". It was found to have " + std::to_string(available));
        }
        return std::nullopt;
    }

    std::string LetterCaseSteganographer::disguise_symbols(const SymbolStream& symbols,
                                                           const std::string& public_text) const
    {
        return walk_public(public_text, symbols, [](std::string& out, char pc, Symbol symbol) {
            const auto uc = static_cast<unsigned char>(pc);
            out.push_back(static_cast<char>(symbol == Symbol::A ? std::tolower(uc) : std::toupper(uc)));
        });
    }

    SymbolStream LetterCaseSteganographer::reveal_symbols(const std::string& input) const
    {
        SymbolStream symbols;
        symbols.reserve(input.size());
        for (char c : input) {
            if (!is_alphabetic(c))
                continue;
            symbols.push_back(std::isupper(static_cast<unsigned char>(c)) ? Symbol::B : Symbol::A);
        }
        return symbols;
    }
} // Bacon
